#include "texture_cache.hpp"

#include <SDL_image.h>

#include <utility>

#include "core/stage_settings.hpp"
#include "ui/styles.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace {

constexpr int kPlaceholderW = 240;
constexpr int kPlaceholderH = 320;

struct SurfaceDeleter { void operator()(SDL_Surface* s) const { if (s) SDL_FreeSurface(s); } };
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

void fill(SDL_Surface* surface, const SDL_Rect& rect, const SDL_Color& c) {
    SDL_FillRect(surface, &rect, SDL_MapRGBA(surface->format, c.r, c.g, c.b, c.a));
}

}

TextureCache::TextureCache(SDL_Renderer* renderer, std::string placeholder_url)
: renderer_(renderer), placeholder_url_(std::move(placeholder_url)) {}

TextureCache::~TextureCache() = default;

SDL_Texture* TextureCache::build_placeholder() {
    SurfacePtr surface(SDL_CreateRGBSurfaceWithFormat(0, kPlaceholderW, kPlaceholderH, 32, SDL_PIXELFORMAT_RGBA32));
    if (!surface) {
        vnstage::log::error(std::string("[TextureCache] Unable to allocate placeholder surface: ") + SDL_GetError());
        return nullptr;
    }
    const SDL_Color& bg = Styles::PlaceholderFill();
    const SDL_Color& fig = Styles::PlaceholderFigure();
    fill(surface.get(), SDL_Rect{0, 0, kPlaceholderW, kPlaceholderH}, bg);
    // Head and shoulders silhouette.
    fill(surface.get(), SDL_Rect{kPlaceholderW / 2 - 40, 70, 80, 90}, fig);
    fill(surface.get(), SDL_Rect{kPlaceholderW / 2 - 90, 180, 180, kPlaceholderH - 180}, fig);
    SDL_Texture* texture = SDL_CreateTextureFromSurface(renderer_, surface.get());
    if (!texture) {
        vnstage::log::error(std::string("[TextureCache] Unable to create placeholder texture: ") + SDL_GetError());
    }
    return texture;
}

SDL_Texture* TextureCache::placeholder() {
    if (!placeholder_ && renderer_) {
        placeholder_.reset(build_placeholder());
    }
    return placeholder_.get();
}

SDL_Texture* TextureCache::load(const std::string& url) {
    if (url.empty() || url == vnstage::kBuiltinPlaceholderUrl) {
        return nullptr;
    }
    const std::string path = vnstage::strings::strip_file_scheme(url);
    SDL_Texture* texture = IMG_LoadTexture(renderer_, path.c_str());
    if (!texture) {
        vnstage::log::warn("[TextureCache] Failed to load '" + path + "': " + IMG_GetError());
    }
    return texture;
}

SDL_Texture* TextureCache::get(const std::string& url) {
    if (!renderer_) {
        return nullptr;
    }
    if (url.empty() || url == vnstage::kBuiltinPlaceholderUrl || failed_.count(url)) {
        return placeholder();
    }
    auto it = textures_.find(url);
    if (it != textures_.end()) {
        return it->second.get();
    }
    SDL_Texture* texture = load(url);
    if (!texture && url != placeholder_url_) {
        // A configured placeholder file is tried before the built-in one.
        failed_.insert(url);
        return get(placeholder_url_);
    }
    if (!texture) {
        failed_.insert(url);
        return placeholder();
    }
    textures_.emplace(url, TexturePtr(texture));
    return texture;
}

void TextureCache::retain_only(const std::unordered_set<std::string>& urls) {
    for (auto it = textures_.begin(); it != textures_.end();) {
        if (urls.count(it->first) == 0 && it->first != placeholder_url_) {
            it = textures_.erase(it);
        } else {
            ++it;
        }
    }
}

void TextureCache::clear() {
    textures_.clear();
    failed_.clear();
    placeholder_.reset();
}

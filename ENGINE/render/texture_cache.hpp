#pragma once

#include <SDL.h>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>

// Textures keyed by the URL the engine resolved. Loads lazily on the render thread.
class TextureCache {

	public:
    TextureCache(SDL_Renderer* renderer, std::string placeholder_url);
    ~TextureCache();

    TextureCache(const TextureCache&) = delete;
    TextureCache& operator=(const TextureCache&) = delete;

    // Never returns nullptr while the renderer is valid: images that fail to load are
    // replaced by the built-in placeholder.
    SDL_Texture* get(const std::string& url);

    void retain_only(const std::unordered_set<std::string>& urls);
    void clear();
    std::size_t size() const { return textures_.size(); }

	private:
    struct TextureDeleter { void operator()(SDL_Texture* t) const { if (t) SDL_DestroyTexture(t); } };
    using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

    SDL_Texture* load(const std::string& url);
    SDL_Texture* placeholder();
    SDL_Texture* build_placeholder();

    SDL_Renderer* renderer_ = nullptr;
    std::string placeholder_url_;
    std::unordered_map<std::string, TexturePtr> textures_;
    std::unordered_set<std::string> failed_;
    TexturePtr placeholder_;
};

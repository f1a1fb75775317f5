#include "sprite_resolver.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/errors.hpp"
#include "core/stage_settings.hpp"
#include "model/emotions.hpp"
#include "utils/log.hpp"

namespace vnstage {
namespace {

const Sprite* find_by_emotion(const std::vector<Sprite>& sprites, const std::string& emotion) {
    if (emotion.empty()) return nullptr;
    auto it = std::find_if(sprites.begin(), sprites.end(),
                           [&](const Sprite& s) { return s.emotion == emotion; });
    return it == sprites.end() ? nullptr : &*it;
}

std::string describe(const Character& character) {
    return "'" + character.name + "' (#" + std::to_string(character.id) + ")";
}

}

const char* to_string(ResolutionTier tier) {
    switch (tier) {
        case ResolutionTier::ExactMatch:     return "exact";
        case ResolutionTier::DefaultEmotion: return "default";
        case ResolutionTier::FirstSprite:    return "first";
        case ResolutionTier::Portrait:       return "portrait";
        case ResolutionTier::Placeholder:    return "placeholder";
    }
    return "placeholder";
}

SpriteResolver::SpriteResolver(SpriteRepository& repository,
                               AsyncCompletionQueue& completions,
                               std::string default_emotion,
                               std::string placeholder_url)
: repository_(repository),
  completions_(completions),
  default_emotion_(std::move(default_emotion)),
  placeholder_url_(placeholder_url.empty() ? std::string(kBuiltinPlaceholderUrl) : std::move(placeholder_url)) {}

Resolution SpriteResolver::static_fallback(const Character& character) const {
    if (!character.image.empty()) {
        return Resolution{character.image, ResolutionTier::Portrait};
    }
    return Resolution{placeholder_url_, ResolutionTier::Placeholder};
}

const Sprite* SpriteResolver::select_sprite(const std::vector<Sprite>& sprites,
                                            const std::string& target_emotion,
                                            const std::string& default_emotion,
                                            ResolutionTier* tier) {
    if (const Sprite* exact = find_by_emotion(sprites, target_emotion)) {
        if (tier) *tier = ResolutionTier::ExactMatch;
        return exact;
    }
    if (const Sprite* fallback = find_by_emotion(sprites, default_emotion)) {
        if (tier) *tier = ResolutionTier::DefaultEmotion;
        return fallback;
    }
    if (!sprites.empty()) {
        if (tier) *tier = ResolutionTier::FirstSprite;
        return &sprites.front();
    }
    return nullptr;
}

void SpriteResolver::resolve(const Character& character, const std::string& target_emotion, Callback done) {
    if (!done) return;
    if (!target_emotion.empty() && !emotions::is_known_emotion(target_emotion)) {
        vnstage::log::debug("[SpriteResolver] Unrecognised emotion tag '" + target_emotion + "' for " +
                            describe(character) + "; matching it literally.");
    }

    std::future<std::vector<Sprite>> inventory;
    try {
        inventory = repository_.scan_and_sync(character);
    } catch (const std::exception& ex) {
        vnstage::log::warn("[SpriteResolver] Inventory scan failed for " + describe(character) + ": " + ex.what());
        done(static_fallback(character));
        return;
    }

    completions_.watch<std::vector<Sprite>>(
        std::move(inventory),
        [this, character, target_emotion, done](std::future<std::vector<Sprite>>& result) {
            on_inventory(character, target_emotion, result, done);
        });
}

void SpriteResolver::on_inventory(const Character& character,
                                  const std::string& target_emotion,
                                  std::future<std::vector<Sprite>>& inventory,
                                  const Callback& done) {
    std::vector<Sprite> sprites;
    try {
        sprites = inventory.get();
    } catch (const StorageUnavailable& ex) {
        vnstage::log::warn("[SpriteResolver] Storage unavailable scanning " + describe(character) + ": " + ex.what());
        done(static_fallback(character));
        return;
    } catch (const std::exception& ex) {
        vnstage::log::warn("[SpriteResolver] Inventory scan failed for " + describe(character) + ": " + ex.what());
        done(static_fallback(character));
        return;
    }

    ResolutionTier tier = ResolutionTier::Placeholder;
    const Sprite* chosen = select_sprite(sprites, target_emotion, default_emotion_, &tier);
    if (!chosen) {
        Resolution fallback = static_fallback(character);
        vnstage::log::debug("[SpriteResolver] No sprites for " + describe(character) + "; using " +
                            to_string(fallback.tier) + ".");
        done(fallback);
        return;
    }

    std::future<std::string> url;
    try {
        url = repository_.load_as_url(character.id, chosen->filename);
    } catch (const std::exception& ex) {
        vnstage::log::warn("[SpriteResolver] Could not load '" + chosen->filename + "' for " +
                           describe(character) + ": " + ex.what());
        done(static_fallback(character));
        return;
    }

    const std::string filename = chosen->filename;
    completions_.watch<std::string>(
        std::move(url),
        [this, character, filename, tier, done](std::future<std::string>& result) {
            Resolution resolution;
            try {
                resolution = Resolution{result.get(), tier};
            } catch (const std::exception& ex) {
                vnstage::log::warn("[SpriteResolver] Could not load '" + filename + "' for " +
                                   describe(character) + ": " + ex.what());
                resolution = static_fallback(character);
            }
            if (resolution.url.empty()) {
                vnstage::log::warn("[SpriteResolver] Empty URL for '" + filename + "' of " + describe(character) + ".");
                resolution = static_fallback(character);
            }
            done(resolution);
        });
}

}

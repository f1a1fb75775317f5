#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/async_completion_queue.hpp"
#include "model/records.hpp"
#include "sprite_repository.hpp"

namespace vnstage {

enum class ResolutionTier {
    ExactMatch,
    DefaultEmotion,
    FirstSprite,
    Portrait,
    Placeholder,
};

const char* to_string(ResolutionTier tier);

struct Resolution {
    std::string    url;
    ResolutionTier tier = ResolutionTier::Placeholder;
};

// Picks exactly one displayable URL for a character and emotion:
// exact tag, default tag, first sprite, portrait image, built-in placeholder.
// Repository failures are logged and fall through to portrait/placeholder.
class SpriteResolver {
public:
    using Callback = std::function<void(const Resolution&)>;

    SpriteResolver(SpriteRepository& repository,
                   AsyncCompletionQueue& completions,
                   std::string default_emotion,
                   std::string placeholder_url);

    // Always refreshes the inventory first. done runs on the UI loop, exactly once.
    void resolve(const Character& character, const std::string& target_emotion, Callback done);

    // Portrait image if set, otherwise the placeholder. Never empty.
    Resolution static_fallback(const Character& character) const;

    // Steps 1-3 of the chain over an inventory. Returns nullptr when it is empty.
    static const Sprite* select_sprite(const std::vector<Sprite>& sprites,
                                       const std::string& target_emotion,
                                       const std::string& default_emotion,
                                       ResolutionTier* tier = nullptr);

    const std::string& default_emotion() const { return default_emotion_; }
    const std::string& placeholder_url() const { return placeholder_url_; }

private:
    void on_inventory(const Character& character,
                      const std::string& target_emotion,
                      std::future<std::vector<Sprite>>& inventory,
                      const Callback& done);

    SpriteRepository&     repository_;
    AsyncCompletionQueue& completions_;
    std::string           default_emotion_;
    std::string           placeholder_url_;
};

}

#pragma once

#include <cstdint>
#include <string>

namespace vnstage {

inline constexpr const char* kBuiltinPlaceholderUrl = "builtin://placeholder";

struct TransitionTimings {
    std::uint64_t fade_out_ms = 300;
    std::uint64_t fade_in_ms  = 300;
};

struct StageSettings {
    TransitionTimings timings{};
    std::string default_emotion = "neutral";
    std::string placeholder_url = kBuiltinPlaceholderUrl;
    std::string characters_root = "user/characters";
    int window_width  = 1280;
    int window_height = 720;
};

}

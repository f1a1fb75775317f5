#pragma once

#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>

namespace ui_fonts {

// First candidate that exists on disk, else the first non-empty one so the TTF error
// message names a sensible path.
inline std::string first_existing(std::initializer_list<const char*> candidates) {
    const char* fallback = nullptr;
    for (const char* path : candidates) {
        if (!path || !*path) continue;
        if (!fallback) fallback = path;
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec) && !ec) {
            return std::string(path);
        }
    }
    return fallback ? std::string(fallback) : std::string{};
}

inline std::string label_bold() {
    if (const char* custom = std::getenv("VNSTAGE_LABEL_FONT")) {
        if (*custom) return custom;
    }
#ifdef _WIN32
    return first_existing({
        "C:/Windows/Fonts/segoeuib.ttf",
        "C:/Windows/Fonts/arialbd.ttf"
    });
#else
    return first_existing({
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/truetype/noto/NotoSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf"
    });
#endif
}

inline std::string dialogue_regular() {
    if (const char* custom = std::getenv("VNSTAGE_DIALOGUE_FONT")) {
        if (*custom) return custom;
    }
#ifdef _WIN32
    return first_existing({
        "C:/Windows/Fonts/georgia.ttf",
        "C:/Windows/Fonts/segoeui.ttf"
    });
#else
    return first_existing({
        "/usr/share/fonts/truetype/dejavu/DejaVuSerif.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSerif-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoSerif-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSerif.ttf"
    });
#endif
}

}

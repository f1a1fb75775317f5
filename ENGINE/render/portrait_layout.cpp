#include "portrait_layout.hpp"

#include <algorithm>
#include <cmath>

namespace portrait_layout {

namespace {
constexpr float kDialogueHeightRatio = 0.28f;
constexpr float kPortraitAspect      = 3.0f / 4.0f;
constexpr int   kMargin              = 24;
constexpr int   kGap                 = 16;
}

ScreenLayout compute_screen_layout(int screen_w, int screen_h) {
    ScreenLayout layout;
    const int w = std::max(0, screen_w);
    const int h = std::max(0, screen_h);

    const int box_h = static_cast<int>(std::lround(h * kDialogueHeightRatio));
    layout.dialogue_box = SDL_Rect{ kMargin, h - box_h - kMargin, std::max(0, w - 2 * kMargin), box_h };

    const int stage_h = std::max(0, layout.dialogue_box.y - kMargin);
    layout.group_stage = SDL_Rect{ kMargin, kMargin, std::max(0, w - 2 * kMargin), stage_h };

    const int solo_h = stage_h;
    const int solo_w = static_cast<int>(std::lround(solo_h * kPortraitAspect));
    layout.solo_portrait = SDL_Rect{ (w - solo_w) / 2, kMargin, solo_w, solo_h };
    return layout;
}

std::vector<SDL_Rect> group_regions(const SDL_Rect& stage, std::size_t count) {
    std::vector<SDL_Rect> regions;
    if (count == 0 || stage.w <= 0 || stage.h <= 0) {
        return regions;
    }
    const int n = static_cast<int>(count);
    const int slot_w_limit = (stage.w - kGap * (n - 1)) / n;
    int region_h = stage.h;
    int region_w = static_cast<int>(std::lround(region_h * kPortraitAspect));
    if (region_w > slot_w_limit) {
        region_w = std::max(1, slot_w_limit);
        region_h = static_cast<int>(std::lround(region_w / kPortraitAspect));
    }
    const int total_w = region_w * n + kGap * (n - 1);
    int x = stage.x + (stage.w - total_w) / 2;
    const int y = stage.y + stage.h - region_h;
    regions.reserve(count);
    for (int i = 0; i < n; ++i) {
        regions.push_back(SDL_Rect{ x, y, region_w, region_h });
        x += region_w + kGap;
    }
    return regions;
}

SDL_Rect fit_bottom(const SDL_Rect& region, int image_w, int image_h) {
    if (image_w <= 0 || image_h <= 0 || region.w <= 0 || region.h <= 0) {
        return region;
    }
    const double scale = std::min(static_cast<double>(region.w) / image_w,
                                  static_cast<double>(region.h) / image_h);
    const int w = static_cast<int>(std::lround(image_w * scale));
    const int h = static_cast<int>(std::lround(image_h * scale));
    return SDL_Rect{ region.x + (region.w - w) / 2, region.y + region.h - h, w, h };
}

Uint8 portrait_alpha(const std::string& fade_class, float progress) {
    const float t = std::clamp(std::isfinite(progress) ? progress : 1.0f, 0.0f, 1.0f);
    float alpha = 1.0f;
    if (fade_class == "sprite-fade-out") {
        alpha = 1.0f - t;
    } else if (fade_class == "sprite-fade-in") {
        alpha = t;
    }
    return static_cast<Uint8>(std::lround(alpha * 255.0f));
}

}

#pragma once

#include <SDL.h>

#include <cstdint>
#include <string>
#include <vector>

namespace portrait_layout {

// Screen regions for the two VN layouts. Group portraits stand in a row across the
// whole window; the solo portrait sits inside the dialogue layout above the text box.
struct ScreenLayout {
    SDL_Rect dialogue_box{0, 0, 0, 0};
    SDL_Rect solo_portrait{0, 0, 0, 0};
    SDL_Rect group_stage{0, 0, 0, 0};
};

ScreenLayout compute_screen_layout(int screen_w, int screen_h);

// Left-to-right regions for count portraits inside stage, each with a 3:4 aspect.
std::vector<SDL_Rect> group_regions(const SDL_Rect& stage, std::size_t count);

// Fits a w x h image into region keeping aspect, bottom-aligned.
SDL_Rect fit_bottom(const SDL_Rect& region, int image_w, int image_h);

// Opacity for a fade class at a progress of 0..1.
Uint8 portrait_alpha(const std::string& fade_class, float progress);

}

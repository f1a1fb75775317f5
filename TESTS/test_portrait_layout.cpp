#include "doctest/doctest.h"

#include <cstdlib>
#include <string>
#include <vector>

#include "render/portrait_layout.hpp"
#include "ui/text_draw.hpp"

TEST_CASE("group regions sit left to right inside the stage") {
    const SDL_Rect stage{24, 24, 1232, 470};
    const auto regions = portrait_layout::group_regions(stage, 3);

    REQUIRE(regions.size() == 3);
    for (std::size_t i = 0; i < regions.size(); ++i) {
        CHECK(regions[i].x >= stage.x);
        CHECK(regions[i].x + regions[i].w <= stage.x + stage.w);
        CHECK(regions[i].y + regions[i].h == stage.y + stage.h);
        if (i > 0) {
            CHECK(regions[i].x > regions[i - 1].x + regions[i - 1].w);
            CHECK(regions[i].w == regions[0].w);
        }
    }
    const int left_gap = regions.front().x - stage.x;
    const int right_gap = stage.x + stage.w - (regions.back().x + regions.back().w);
    CHECK(std::abs(left_gap - right_gap) <= 1);
}

TEST_CASE("crowded stages shrink regions instead of overflowing") {
    const SDL_Rect stage{0, 0, 400, 400};
    const auto regions = portrait_layout::group_regions(stage, 6);
    REQUIRE(regions.size() == 6);
    CHECK(regions.back().x + regions.back().w <= 400);
    CHECK(regions.front().h < 400);
    CHECK(portrait_layout::group_regions(stage, 0).empty());
}

TEST_CASE("screen layout keeps the portrait stage above the dialogue box") {
    const auto layout = portrait_layout::compute_screen_layout(1280, 720);
    CHECK(layout.group_stage.y + layout.group_stage.h <= layout.dialogue_box.y);
    CHECK(layout.solo_portrait.y + layout.solo_portrait.h <= layout.dialogue_box.y);
    CHECK(layout.dialogue_box.y + layout.dialogue_box.h <= 720);
    CHECK(layout.solo_portrait.w > 0);
}

TEST_CASE("fit_bottom preserves aspect and anchors to the bottom edge") {
    const SDL_Rect region{10, 10, 300, 400};
    const SDL_Rect fitted = portrait_layout::fit_bottom(region, 600, 600);
    CHECK(fitted.w == 300);
    CHECK(fitted.h == 300);
    CHECK(fitted.x == 10);
    CHECK(fitted.y == 110);
}

TEST_CASE("portrait alpha follows the fade class") {
    CHECK(portrait_layout::portrait_alpha("sprite-visible", 0.2f) == 255);
    CHECK(portrait_layout::portrait_alpha("sprite-fade-out", 0.0f) == 255);
    CHECK(portrait_layout::portrait_alpha("sprite-fade-out", 1.0f) == 0);
    CHECK(portrait_layout::portrait_alpha("sprite-fade-in", 0.0f) == 0);
    CHECK(portrait_layout::portrait_alpha("sprite-fade-in", 2.0f) == 255);
}

TEST_CASE("wrap_words breaks on width and on newlines") {
    const auto width = [](const std::string& s) { return static_cast<int>(s.size()); };

    const auto lines = text_draw::wrap_words("the quick brown fox\njumps", 10, width);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "the quick");
    CHECK(lines[1] == "brown fox");
    CHECK(lines[2] == "jumps");

    const auto single = text_draw::wrap_words("incomprehensibilities", 5, width);
    REQUIRE(single.size() == 1);
    CHECK(single[0] == "incomprehensibilities");

    CHECK(text_draw::wrap_words("\n\n", 10, width).empty());
}

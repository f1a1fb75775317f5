#pragma once

#include <string>

#include "model/records.hpp"
#include "transition_controller.hpp"

namespace vnstage {

// Snapshot of one portrait slot as the engine sees it.
struct SpriteSlot {
    CharacterId character_id = 0;
    std::string character_name;
    std::string resolved_url;
    std::string display_url;
    FadeState   fade_state = FadeState::FadeIn;
    int         display_order = 0;
    bool        is_current_speaker = false;
    bool        loading = false;
    float       fade_progress = 1.0f;
};

// What the presentation layer draws for a slot.
struct RenderableSlot {
    CharacterId character_id = 0;
    std::string image_url;       // empty until the first resolution lands
    std::string display_name;
    bool        current_speaker = false;
    std::string fade_class;
    float       fade_progress = 1.0f;
    bool        loading = false;
    int         display_order = 0;
};

RenderableSlot make_renderable(const SpriteSlot& slot);

// True while the slot should be drawn as the neutral loading card: nothing revealed
// yet, or a newer resolution still in flight.
bool shows_loading_card(const RenderableSlot& slot);

}

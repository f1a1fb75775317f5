#include "sprite_slot.hpp"

namespace vnstage {

RenderableSlot make_renderable(const SpriteSlot& slot) {
    RenderableSlot out;
    out.character_id = slot.character_id;
    out.image_url = slot.display_url;
    out.display_name = slot.character_name;
    out.current_speaker = slot.is_current_speaker;
    out.fade_class = fade_class(slot.fade_state);
    out.fade_progress = slot.fade_progress;
    out.loading = slot.loading;
    out.display_order = slot.display_order;
    return out;
}

bool shows_loading_card(const RenderableSlot& slot) {
    return slot.loading || slot.image_url.empty();
}

}

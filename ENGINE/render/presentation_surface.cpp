#include "presentation_surface.hpp"

#include <unordered_set>
#include <utility>

#include "portrait_layout.hpp"
#include "ui/styles.hpp"
#include "ui/text_draw.hpp"
#include "utils/log.hpp"

PresentationSurface::PresentationSurface(SDL_Renderer* renderer, std::string placeholder_url)
: renderer_(renderer), textures_(renderer, std::move(placeholder_url)) {}

PresentationSurface::~PresentationSurface() {
    if (name_font_) TTF_CloseFont(name_font_);
    if (loading_font_) TTF_CloseFont(loading_font_);
}

void PresentationSurface::ensure_fonts() {
    if (fonts_attempted_) return;
    fonts_attempted_ = true;
    name_font_ = Styles::PortraitName().open_font();
    if (!name_font_) {
        vnstage::log::warn(std::string("[PresentationSurface] Name font unavailable: ") + TTF_GetError());
    }
    loading_font_ = Styles::LoadingText().open_font();
    if (!loading_font_) {
        vnstage::log::warn(std::string("[PresentationSurface] Loading font unavailable: ") + TTF_GetError());
    }
}

void PresentationSurface::render_inline(const std::vector<vnstage::RenderableSlot>& slots, const SDL_Rect& area) {
    if (!renderer_) return;
    release_unused(slots);
    if (slots.empty()) return;
    draw_region(slots.front(), area, false);
}

void PresentationSurface::render_layer(const std::vector<vnstage::RenderableSlot>& slots, const SDL_Rect& stage) {
    if (!renderer_) return;
    release_unused(slots);
    const std::vector<SDL_Rect> regions = portrait_layout::group_regions(stage, slots.size());
    for (std::size_t i = 0; i < slots.size() && i < regions.size(); ++i) {
        draw_region(slots[i], regions[i], true);
    }
}

void PresentationSurface::tear_down() {
    textures_.clear();
}

void PresentationSurface::release_unused(const std::vector<vnstage::RenderableSlot>& slots) {
    std::unordered_set<std::string> live;
    for (const auto& slot : slots) {
        live.insert(slot.image_url);
    }
    textures_.retain_only(live);
}

void PresentationSurface::draw_region(const vnstage::RenderableSlot& slot, const SDL_Rect& region, bool show_label) {
    ensure_fonts();

    if (vnstage::shows_loading_card(slot)) {
        // The previous portrait is never shown while a newer resolution is pending.
        draw_loading(region);
    } else if (SDL_Texture* texture = textures_.get(slot.image_url)) {
        int tw = 0;
        int th = 0;
        SDL_QueryTexture(texture, nullptr, nullptr, &tw, &th);
        const SDL_Rect dst = portrait_layout::fit_bottom(region, tw, th);
        SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND);
        SDL_SetTextureAlphaMod(texture, portrait_layout::portrait_alpha(slot.fade_class, slot.fade_progress));
        SDL_RenderCopy(renderer_, texture, nullptr, &dst);
        SDL_SetTextureAlphaMod(texture, 255);
    }

    if (slot.current_speaker) {
        text_draw::outline_rect(renderer_, region, Styles::SpeakerPlate().outline, 2);
    }
    if (show_label) {
        draw_name_plate(slot, region);
    }
}

void PresentationSurface::draw_loading(const SDL_Rect& region) {
    text_draw::fill_rect(renderer_, region, Styles::PlaceholderFill());
    text_draw::outline_rect(renderer_, region, Styles::NamePlate().outline, 1);
    if (!loading_font_) return;
    const std::string label = "Loading...";
    const int w = text_draw::measure(loading_font_, label);
    const int h = TTF_FontHeight(loading_font_);
    text_draw::draw_text(renderer_, loading_font_, label, region.x + (region.w - w) / 2,
                         region.y + (region.h - h) / 2, Styles::LoadingText().color);
}

void PresentationSurface::draw_name_plate(const vnstage::RenderableSlot& slot, const SDL_Rect& region) {
    if (!name_font_ || slot.display_name.empty()) return;
    const PanelStyle& style = slot.current_speaker ? Styles::SpeakerPlate() : Styles::NamePlate();
    const int pad = 6;
    const int text_w = text_draw::measure(name_font_, slot.display_name);
    const int text_h = TTF_FontHeight(name_font_);
    SDL_Rect plate{ region.x + (region.w - text_w) / 2 - pad, region.y + region.h - text_h - 2 * pad,
                    text_w + 2 * pad, text_h + pad };
    text_draw::fill_rect(renderer_, plate, style.fill);
    text_draw::outline_rect(renderer_, plate, style.outline, 1);
    SDL_Color color = slot.current_speaker ? style.accent : Styles::PortraitName().color;
    text_draw::draw_text(renderer_, name_font_, slot.display_name, plate.x + pad, plate.y + pad / 2, color);
}

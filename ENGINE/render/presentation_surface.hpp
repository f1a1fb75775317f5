#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <string>
#include <vector>

#include "stage/sprite_slot.hpp"
#include "texture_cache.hpp"

// Draws the engine's renderable slots. The viewer owns two of these: one drawn inside the
// dialogue layout for solo mode, and one portrait layer drawn above everything else for
// group mode so surrounding panels can never clip or cover a portrait.
class PresentationSurface {

	public:
    PresentationSurface(SDL_Renderer* renderer, std::string placeholder_url);
    ~PresentationSurface();

    PresentationSurface(const PresentationSurface&) = delete;
    PresentationSurface& operator=(const PresentationSurface&) = delete;

    // Solo: one region at the given rect.
    void render_inline(const std::vector<vnstage::RenderableSlot>& slots, const SDL_Rect& area);

    // Group: one region per slot, left to right in the order given.
    void render_layer(const std::vector<vnstage::RenderableSlot>& slots, const SDL_Rect& stage);

    // Releases every texture; called when the layer is torn down.
    void tear_down();

	private:
    void draw_region(const vnstage::RenderableSlot& slot, const SDL_Rect& region, bool show_label);
    void draw_loading(const SDL_Rect& region);
    void draw_name_plate(const vnstage::RenderableSlot& slot, const SDL_Rect& region);
    void release_unused(const std::vector<vnstage::RenderableSlot>& slots);
    void ensure_fonts();

    SDL_Renderer* renderer_ = nullptr;
    TextureCache  textures_;
    TTF_Font*     name_font_ = nullptr;
    TTF_Font*     loading_font_ = nullptr;
    bool          fonts_attempted_ = false;
};

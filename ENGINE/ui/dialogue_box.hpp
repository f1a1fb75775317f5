#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <cstdint>
#include <string>

// Text panel of the VN layout: speaker name plate, wrapped message text and a typing
// indicator while the message is still being generated.
class DialogueBox {

	public:
    explicit DialogueBox(SDL_Renderer* renderer);
    ~DialogueBox();

    DialogueBox(const DialogueBox&) = delete;
    DialogueBox& operator=(const DialogueBox&) = delete;

    void render(const SDL_Rect& area,
                const std::string& speaker,
                const std::string& text,
                bool is_generating,
                std::uint64_t now_ms);

	private:
    void ensure_fonts();

    SDL_Renderer* renderer_ = nullptr;
    TTF_Font*     speaker_font_ = nullptr;
    TTF_Font*     text_font_ = nullptr;
    bool          fonts_attempted_ = false;
};

#pragma once

#include <SDL.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/session_loader.hpp"

class PresentationSurface;
class DialogueBox;

namespace vnstage {
class VnStage;
class FilesystemSpriteRepository;
}

class ViewerApp {

        public:
    ViewerApp(session::SessionData session, SDL_Renderer* renderer, int screen_w, int screen_h);
    virtual ~ViewerApp();
    virtual void init();
    virtual void main_loop();
	protected:
    void enter_vn_mode();
    void show_current_message();
    void step(int delta);
    void render_frame(std::uint64_t now_ms);
    const vnstage::Message* current_message() const;

    session::SessionData session_;
    SDL_Renderer* renderer_   = nullptr;
    int           screen_w_   = 0;
    int           screen_h_   = 0;
    std::unique_ptr<vnstage::FilesystemSpriteRepository> repository_;
    std::unique_ptr<vnstage::VnStage> stage_;
    std::unique_ptr<PresentationSurface> inline_surface_;
    std::unique_ptr<PresentationSurface> portrait_layer_;
    std::unique_ptr<DialogueBox> dialogue_;
    std::ptrdiff_t message_index_ = -1;
    bool vn_active_ = false;
};

void run(SDL_Window* window, SDL_Renderer* renderer, int screen_w, int screen_h, session::SessionData session);

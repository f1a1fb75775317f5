#include "main.hpp"
#include "render/portrait_layout.hpp"
#include "render/presentation_surface.hpp"
#include "sprites/filesystem_sprite_repository.hpp"
#include "model/group_roster.hpp"
#include "stage/vn_stage.hpp"
#include "ui/dialogue_box.hpp"
#include "ui/styles.hpp"
#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include "utils/log.hpp"

namespace fs = std::filesystem;

ViewerApp::ViewerApp(session::SessionData session,
                     SDL_Renderer* renderer,
                     int screen_w,
                     int screen_h)
: session_(std::move(session)),
  renderer_(renderer),
  screen_w_(screen_w),
  screen_h_(screen_h) {}

ViewerApp::~ViewerApp() {
        // The stage must drop its pending completions before the repository goes away.
        stage_.reset();
        repository_.reset();
}

void ViewerApp::init() {
        repository_ = std::make_unique<vnstage::FilesystemSpriteRepository>(fs::path(session_.settings.characters_root));
        stage_ = std::make_unique<vnstage::VnStage>(*repository_, session_.settings);
        inline_surface_ = std::make_unique<PresentationSurface>(renderer_, session_.settings.placeholder_url);
        portrait_layer_ = std::make_unique<PresentationSurface>(renderer_, session_.settings.placeholder_url);
        dialogue_ = std::make_unique<DialogueBox>(renderer_);
        vnstage::log::info("[ViewerApp] Sprite root: " + session_.settings.characters_root);

        message_index_ = session_.chat.messages.empty() ? -1 : 0;
        enter_vn_mode();
        main_loop();
}

const vnstage::Message* ViewerApp::current_message() const {
        if (message_index_ < 0 || message_index_ >= static_cast<std::ptrdiff_t>(session_.chat.messages.size())) {
                return nullptr;
        }
        return &session_.chat.messages[static_cast<std::size_t>(message_index_)];
}

void ViewerApp::enter_vn_mode() {
        vn_active_ = true;
        show_current_message();
}

void ViewerApp::show_current_message() {
        if (!vn_active_) return;
        const vnstage::CharacterId active = session_.chat.active_id;
        const vnstage::Message* message = current_message();

        if (const vnstage::Group* group = session_.find_group(active)) {
                for (const auto& problem : vnstage::roster::validate_group(*group)) {
                        vnstage::log::warn("[ViewerApp] Group '" + group->name + "': " + problem);
                }
                stage_->show_group(*group, session_.characters, message);
                return;
        }
        if (const vnstage::Character* character = vnstage::find_character(session_.characters, active)) {
                stage_->show_solo(*character, message);
                return;
        }
        vnstage::log::warn("[ViewerApp] Chat refers to unknown character or group #" + std::to_string(active) + ".");
        stage_->exit();
}

void ViewerApp::step(int delta) {
        const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(session_.chat.messages.size());
        if (count == 0) return;
        const std::ptrdiff_t next = message_index_ + delta;
        if (next < 0 || next >= count) return;
        message_index_ = next;
        show_current_message();
}

void ViewerApp::render_frame(std::uint64_t now_ms) {
        const SDL_Color& bg = Styles::Backdrop();
        SDL_SetRenderTarget(renderer_, nullptr);
        SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, bg.a);
        SDL_RenderClear(renderer_);

        const portrait_layout::ScreenLayout layout = portrait_layout::compute_screen_layout(screen_w_, screen_h_);
        const std::vector<vnstage::RenderableSlot> slots = stage_->renderables();

        if (stage_->mode() == vnstage::StageMode::Solo) {
                inline_surface_->render_inline(slots, layout.solo_portrait);
        }

        if (vn_active_) {
                const vnstage::Message* message = current_message();
                if (message) {
                        dialogue_->render(layout.dialogue_box, stage_->speaker_label(*message), message->text,
                                          message->is_generating, now_ms);
                } else {
                        std::string name;
                        if (!slots.empty()) name = slots.front().display_name;
                        dialogue_->render(layout.dialogue_box, name, "Start the conversation to begin...", false, now_ms);
                }
        }

        // Drawn last so the dialogue panel can never cover a group portrait.
        if (stage_->mode() == vnstage::StageMode::Group) {
                portrait_layer_->render_layer(slots, layout.group_stage);
        }

        SDL_RenderPresent(renderer_);
}

void ViewerApp::main_loop() {
        bool running = true;
        vnstage::StageMode last_mode = stage_->mode();
        while (running) {
                SDL_Event e;
                while (SDL_PollEvent(&e)) {
                        if (e.type == SDL_QUIT) {
                                running = false;
                                break;
                        }
                        if (e.type != SDL_KEYDOWN) continue;
                        switch (e.key.keysym.sym) {
                        case SDLK_q:
                                running = false;
                                break;
                        case SDLK_RIGHT:
                        case SDLK_SPACE:
                                step(+1);
                                break;
                        case SDLK_LEFT:
                                step(-1);
                                break;
                        case SDLK_ESCAPE:
                                vn_active_ = false;
                                stage_->exit();
                                break;
                        case SDLK_RETURN:
                                if (!vn_active_) enter_vn_mode();
                                break;
                        default:
                                break;
                        }
                }

                const std::uint64_t now = SDL_GetTicks64();
                stage_->update(now);

                if (last_mode != stage_->mode()) {
                        if (last_mode == vnstage::StageMode::Group) portrait_layer_->tear_down();
                        if (last_mode == vnstage::StageMode::Solo) inline_surface_->tear_down();
                        last_mode = stage_->mode();
                }

                render_frame(now);
                SDL_Delay(16);
        }
}

void run(SDL_Window* window,
         SDL_Renderer* renderer,
         int screen_w,
         int screen_h,
         session::SessionData session) {
    (void)window;
    ViewerApp app(std::move(session), renderer, screen_w, screen_h);
    app.init();
}

int main(int argc, char* argv[]) {
        vnstage::log::info("[Main] Starting VN stage viewer...");
        const std::string session_path =
                (argc > 1 && argv[1] && *argv[1]) ? std::string(argv[1]) : session::default_session_path();

        session::SessionData session;
        try {
                session = session::load_session(session_path);
        } catch (const std::exception& ex) {
                vnstage::log::error(std::string("[Main] Failed to load session: ") + ex.what());
                return 1;
        }

        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
                vnstage::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }

        if (TTF_Init() < 0) {
                vnstage::log::error(std::string("TTF_Init failed: ") + TTF_GetError());
                SDL_Quit();
                return 1;
        }

        const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG | IMG_INIT_WEBP;
        if ((IMG_Init(img_flags) & (IMG_INIT_PNG | IMG_INIT_JPG)) != (IMG_INIT_PNG | IMG_INIT_JPG)) {
                vnstage::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Window* window = SDL_CreateWindow("VN Stage", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                              session.settings.window_width, session.settings.window_height,
                                              SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
        if (!window) {
                vnstage::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        SDL_Renderer* renderer =
                SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer) {
                vnstage::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
                SDL_DestroyWindow(window);
                IMG_Quit();
                TTF_Quit();
                SDL_Quit();
                return 1;
        }

        int screen_width = 0;
        int screen_height = 0;
        SDL_GetRendererOutputSize(renderer, &screen_width, &screen_height);
        vnstage::log::info(std::string("[Main] Output size: ") + std::to_string(screen_width) + "x" + std::to_string(screen_height));

        run(window, renderer, screen_width, screen_height, std::move(session));

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        vnstage::log::info("[Main] Viewer exited cleanly.");
        return 0;
}

#include "dialogue_box.hpp"

#include <vector>

#include "styles.hpp"
#include "text_draw.hpp"
#include "utils/log.hpp"

DialogueBox::DialogueBox(SDL_Renderer* renderer)
: renderer_(renderer) {}

DialogueBox::~DialogueBox() {
    if (speaker_font_) TTF_CloseFont(speaker_font_);
    if (text_font_) TTF_CloseFont(text_font_);
}

void DialogueBox::ensure_fonts() {
    if (fonts_attempted_) return;
    fonts_attempted_ = true;
    speaker_font_ = Styles::SpeakerName().open_font();
    text_font_ = Styles::DialogueText().open_font();
    if (!speaker_font_ || !text_font_) {
        vnstage::log::warn(std::string("[DialogueBox] Font unavailable, text will be hidden: ") + TTF_GetError());
    }
}

void DialogueBox::render(const SDL_Rect& area,
                         const std::string& speaker,
                         const std::string& text,
                         bool is_generating,
                         std::uint64_t now_ms) {
    if (!renderer_) return;
    ensure_fonts();

    const PanelStyle& panel = Styles::DialoguePanel();
    text_draw::fill_rect(renderer_, area, panel.fill);
    text_draw::outline_rect(renderer_, area, panel.outline, 2);

    const int pad = 18;
    int y = area.y + pad;
    if (speaker_font_ && !speaker.empty()) {
        text_draw::draw_text(renderer_, speaker_font_, speaker, area.x + pad, y, Styles::SpeakerName().color);
        y += TTF_FontLineSkip(speaker_font_) + pad / 2;
    }
    if (!text_font_) return;

    std::string body = text;
    if (is_generating) {
        const int dots = static_cast<int>((now_ms / 400) % 3) + 1;
        body += (body.empty() ? "" : " ") + std::string(static_cast<std::size_t>(dots), '.');
    }

    const int max_w = area.w - 2 * pad;
    const std::vector<std::string> lines = text_draw::wrap_words(body, max_w, [this](const std::string& s) {
        return text_draw::measure(text_font_, s);
    });
    const int line_h = TTF_FontLineSkip(text_font_);
    for (const auto& line : lines) {
        if (y + line_h > area.y + area.h - pad / 2) break;
        text_draw::draw_text(renderer_, text_font_, line, area.x + pad, y, Styles::DialogueText().color);
        y += line_h;
    }
}

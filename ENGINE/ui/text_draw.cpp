#include "text_draw.hpp"

#include <sstream>

namespace text_draw {

std::vector<std::string> wrap_words(const std::string& text, int max_width, const MeasureFn& measure_fn) {
    std::vector<std::string> lines;
    std::istringstream paragraphs(text);
    std::string paragraph;
    while (std::getline(paragraphs, paragraph)) {
        std::istringstream words(paragraph);
        std::string word;
        std::string current;
        while (words >> word) {
            std::string candidate = current.empty() ? word : current + " " + word;
            if (current.empty() || measure_fn(candidate) <= max_width) {
                current = std::move(candidate);
            } else {
                lines.push_back(current);
                current = word;
            }
        }
        lines.push_back(current);
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

int measure(TTF_Font* font, const std::string& text) {
    if (!font || text.empty()) return 0;
    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font, text.c_str(), &w, &h) != 0) {
        return 0;
    }
    return w;
}

int draw_text(SDL_Renderer* renderer, TTF_Font* font, const std::string& text, int x, int y, SDL_Color color) {
    if (!renderer || !font || text.empty()) return 0;
    SDL_Surface* surf = TTF_RenderUTF8_Blended(font, text.c_str(), color);
    if (!surf) return 0;
    SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, surf);
    const int tw = surf->w;
    const int th = surf->h;
    SDL_FreeSurface(surf);
    if (!tex) return 0;
    SDL_Rect dst{ x, y, tw, th };
    SDL_RenderCopy(renderer, tex, nullptr, &dst);
    SDL_DestroyTexture(tex);
    return tw;
}

void fill_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(renderer, &rect);
}

void outline_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color, int thickness) {
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    for (int i = 0; i < thickness; ++i) {
        SDL_Rect r{ rect.x - i, rect.y - i, rect.w + 2 * i, rect.h + 2 * i };
        SDL_RenderDrawRect(renderer, &r);
    }
}

}

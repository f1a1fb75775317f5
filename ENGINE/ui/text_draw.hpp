#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <functional>
#include <string>
#include <vector>

namespace text_draw {

using MeasureFn = std::function<int(const std::string&)>;

// Greedy word wrap. Explicit newlines always break; a word wider than max_width gets a
// line of its own.
std::vector<std::string> wrap_words(const std::string& text, int max_width, const MeasureFn& measure);

// Renders UTF-8 text at (x, y). Returns the drawn width, 0 if nothing was drawn.
int draw_text(SDL_Renderer* renderer, TTF_Font* font, const std::string& text, int x, int y, SDL_Color color);

int measure(TTF_Font* font, const std::string& text);

void fill_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color);
void outline_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color, int thickness);

}

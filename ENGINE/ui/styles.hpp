#pragma once

#include <SDL.h>
#include <SDL_ttf.h>
#include <string>

struct LabelStyle {
    std::string font_path;
    int         font_size;
    SDL_Color   color;
    TTF_Font* open_font() const {
        return TTF_OpenFont(font_path.c_str(), font_size);
    }
};

struct PanelStyle {
    SDL_Color fill;
    SDL_Color outline;
    SDL_Color accent;
};

class Styles {

	public:
    static const SDL_Color& Backdrop();
    static const SDL_Color& Gold();
    static const SDL_Color& Fog();
    static const SDL_Color& Mist();
    static const SDL_Color& PlaceholderFill();
    static const SDL_Color& PlaceholderFigure();
    static const LabelStyle& PortraitName();
    static const LabelStyle& SpeakerName();
    static const LabelStyle& DialogueText();
    static const LabelStyle& LoadingText();
    static const PanelStyle& DialoguePanel();
    static const PanelStyle& NamePlate();
    static const PanelStyle& SpeakerPlate();
};

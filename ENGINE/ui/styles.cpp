#include "styles.hpp"
#include "font_paths.hpp"

static inline SDL_Color make_color(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
    return SDL_Color{ r, g, b, a };
}

static const SDL_Color kBackdrop  = make_color( 18, 20, 28,255);
static const SDL_Color kGold      = make_color(250,195, 73,255);
static const SDL_Color kGoldDim   = make_color(180,135, 40,255);
static const SDL_Color kSlate     = make_color( 28, 32, 36,220);
static const SDL_Color kCoal      = make_color( 12, 16, 18,200);
static const SDL_Color kFog       = make_color(220,220,200,255);
static const SDL_Color kMist      = make_color(140,160,160,255);
static const SDL_Color kPlaceFill = make_color( 58, 62, 74,255);
static const SDL_Color kPlaceFig  = make_color( 96,102,118,255);

static const LabelStyle kPortraitName{
    ui_fonts::label_bold(), 22, kFog };

static const LabelStyle kSpeakerName{
    ui_fonts::label_bold(), 28, kGold };

static const LabelStyle kDialogueText{
    ui_fonts::dialogue_regular(), 24, kFog };

static const LabelStyle kLoadingText{
    ui_fonts::dialogue_regular(), 20, kMist };

static const PanelStyle kDialoguePanel{ kSlate, kGoldDim, kGold };
static const PanelStyle kNamePlate{ kCoal, kSlate, kFog };
static const PanelStyle kSpeakerPlate{ kCoal, kGold, kGold };

const SDL_Color& Styles::Backdrop()          { return kBackdrop; }
const SDL_Color& Styles::Gold()              { return kGold; }
const SDL_Color& Styles::Fog()               { return kFog; }
const SDL_Color& Styles::Mist()              { return kMist; }
const SDL_Color& Styles::PlaceholderFill()   { return kPlaceFill; }
const SDL_Color& Styles::PlaceholderFigure() { return kPlaceFig; }
const LabelStyle& Styles::PortraitName()     { return kPortraitName; }
const LabelStyle& Styles::SpeakerName()      { return kSpeakerName; }
const LabelStyle& Styles::DialogueText()     { return kDialogueText; }
const LabelStyle& Styles::LoadingText()      { return kLoadingText; }
const PanelStyle& Styles::DialoguePanel()    { return kDialoguePanel; }
const PanelStyle& Styles::NamePlate()        { return kNamePlate; }
const PanelStyle& Styles::SpeakerPlate()     { return kSpeakerPlate; }

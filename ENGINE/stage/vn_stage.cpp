#include "vn_stage.hpp"

#include <utility>

#include "utils/log.hpp"

namespace vnstage {

const char* to_string(StageState state) {
    switch (state) {
        case StageState::Idle:    return "Idle";
        case StageState::Loading: return "Loading";
        case StageState::Ready:   return "Ready";
    }
    return "Idle";
}

VnStage::VnStage(SpriteRepository& repository, StageSettings settings)
: settings_(std::move(settings)),
  resolver_(repository, completions_, settings_.default_emotion, settings_.placeholder_url),
  orchestrator_(resolver_, scheduler_, settings_.timings) {}

VnStage::~VnStage() {
    orchestrator_.clear();
    completions_.clear();
}

void VnStage::switch_to(StageMode mode, CharacterId id) {
    if (mode_ == mode && active_id_ == id) {
        return;
    }
    if (mode_ != StageMode::None) {
        vnstage::log::info(std::string("[VnStage] Active ") + (mode_ == StageMode::Group ? "group" : "character") +
                           " changed; discarding " + std::to_string(orchestrator_.size()) + " slot(s).");
    }
    orchestrator_.clear();
    idle_portrait_.reset();
    mode_ = mode;
    active_id_ = id;
}

void VnStage::show_solo(const Character& character, const Message* message) {
    switch_to(StageMode::Solo, character.id);
    roster_ = {character};
    group_name_.clear();

    if (!message) {
        orchestrator_.clear();
        SpriteSlot portrait;
        portrait.character_id = character.id;
        portrait.character_name = character.name;
        portrait.resolved_url = resolver_.static_fallback(character).url;
        portrait.display_url = portrait.resolved_url;
        portrait.fade_state = FadeState::Visible;
        idle_portrait_ = std::move(portrait);
        log_state_change();
        return;
    }

    idle_portrait_.reset();
    Message effective = *message;
    if (effective.sender == Sender::Character && !effective.speaker_id) {
        effective.speaker_id = character.id;
    }

    GroupMember solo;
    solo.character_id = character.id;
    solo.display_order = 0;
    orchestrator_.update({solo}, roster_, &effective);
    log_state_change();
}

void VnStage::show_group(const Group& group, const std::vector<Character>& roster, const Message* message) {
    switch_to(StageMode::Group, group.id);
    roster_ = roster;
    group_name_ = group.name;
    orchestrator_.update(group.members, roster_, message);
    log_state_change();
}

void VnStage::exit() {
    if (mode_ == StageMode::None) {
        return;
    }
    vnstage::log::info("[VnStage] Leaving VN mode.");
    orchestrator_.clear();
    idle_portrait_.reset();
    roster_.clear();
    group_name_.clear();
    mode_ = StageMode::None;
    active_id_ = 0;
    log_state_change();
}

void VnStage::update(std::uint64_t now_ms) {
    // Clock first, so dwells started by the completions below are measured from now_ms.
    scheduler_.advance_to(now_ms);
    completions_.update();
    log_state_change();
}

StageState VnStage::state() const {
    if (mode_ == StageMode::None) {
        return StageState::Idle;
    }
    if (orchestrator_.any_loading()) {
        return StageState::Loading;
    }
    return StageState::Ready;
}

void VnStage::log_state_change() {
    const StageState current = state();
    if (current == last_logged_state_) {
        return;
    }
    vnstage::log::debug(std::string("[VnStage] ") + to_string(last_logged_state_) + " -> " + to_string(current));
    last_logged_state_ = current;
}

std::vector<SpriteSlot> VnStage::slots() const {
    if (idle_portrait_) {
        return {*idle_portrait_};
    }
    return orchestrator_.slots();
}

std::vector<RenderableSlot> VnStage::renderables() const {
    std::vector<RenderableSlot> out;
    for (const auto& slot : slots()) {
        out.push_back(make_renderable(slot));
    }
    return out;
}

std::string VnStage::speaker_label(const Message& message) const {
    if (message.sender == Sender::User) {
        return "You";
    }
    if (mode_ == StageMode::Solo && !roster_.empty()) {
        return roster_.front().name;
    }
    if (message.speaker_id) {
        if (const Character* speaker = find_character(roster_, *message.speaker_id)) {
            return speaker->name;
        }
    }
    if (message.speaker_name) {
        return *message.speaker_name;
    }
    return group_name_;
}

}

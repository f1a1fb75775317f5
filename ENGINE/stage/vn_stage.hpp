#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/async_completion_queue.hpp"
#include "core/scheduler.hpp"
#include "core/stage_settings.hpp"
#include "group_orchestrator.hpp"
#include "model/records.hpp"
#include "sprite_slot.hpp"
#include "sprites/sprite_repository.hpp"
#include "sprites/sprite_resolver.hpp"

namespace vnstage {

enum class StageState {
    Idle,
    Loading,
    Ready,
};

enum class StageMode {
    None,
    Solo,
    Group,
};

const char* to_string(StageState state);

// Top-level VN mode controller. The composition root feeds it the active character or
// group plus the current message, pumps update() once per frame, and publishes
// renderables() to whatever presentation layer it owns.
class VnStage {
public:
    VnStage(SpriteRepository& repository, StageSettings settings);
    ~VnStage();

    VnStage(const VnStage&) = delete;
    VnStage& operator=(const VnStage&) = delete;

    void show_solo(const Character& character, const Message* message);
    void show_group(const Group& group, const std::vector<Character>& roster, const Message* message);
    void exit();

    // Runs due fade timers, then delivers finished repository calls at now_ms.
    void update(std::uint64_t now_ms);

    StageState state() const;
    StageMode mode() const { return mode_; }
    CharacterId active_id() const { return active_id_; }

    std::vector<SpriteSlot> slots() const;
    std::vector<RenderableSlot> renderables() const;

    // "You" for user messages, otherwise the speaking character's name.
    std::string speaker_label(const Message& message) const;

    const StageSettings& settings() const { return settings_; }
    Scheduler& scheduler() { return scheduler_; }
    AsyncCompletionQueue& completions() { return completions_; }
    const GroupOrchestrator& orchestrator() const { return orchestrator_; }

private:
    void switch_to(StageMode mode, CharacterId id);
    void log_state_change();

    StageSettings        settings_;
    Scheduler            scheduler_;
    AsyncCompletionQueue completions_;
    SpriteResolver       resolver_;
    GroupOrchestrator    orchestrator_;

    StageMode                 mode_ = StageMode::None;
    CharacterId               active_id_ = 0;
    std::string               group_name_;
    std::vector<Character>    roster_;
    std::optional<SpriteSlot> idle_portrait_;
    StageState                last_logged_state_ = StageState::Idle;
};

}

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/cancellation.hpp"
#include "core/scheduler.hpp"
#include "core/stage_settings.hpp"
#include "model/records.hpp"
#include "sprite_slot.hpp"
#include "sprites/sprite_resolver.hpp"
#include "transition_controller.hpp"

namespace vnstage {

// Keeps one slot per group member, keyed by character id so that a member's fade is
// never reset by another member updating. Every update() re-resolves all members in
// parallel; a completion is applied only if it belongs to the newest request for its slot.
class GroupOrchestrator {
public:
    GroupOrchestrator(SpriteResolver& resolver, Scheduler& scheduler, TransitionTimings timings);
    ~GroupOrchestrator();

    GroupOrchestrator(const GroupOrchestrator&) = delete;
    GroupOrchestrator& operator=(const GroupOrchestrator&) = delete;

    void update(const std::vector<GroupMember>& members,
                const std::vector<Character>& roster,
                const Message* message);

    // Discards every slot, its pending timers and any in-flight results.
    void clear();

    // Ordered by display order ascending.
    std::vector<SpriteSlot> slots() const;
    std::vector<SpriteSlot> slots(std::uint64_t now_ms) const;

    bool any_loading() const;
    std::size_t size() const { return slots_.size(); }
    const TransitionController* transition_for(CharacterId id) const;

    // Emotion the given member should show for a message.
    static std::string target_emotion_for(CharacterId member_id,
                                          const Message* message,
                                          const std::string& default_emotion);
    static bool is_speaker(CharacterId member_id, const Message* message);

private:
    struct SlotState {
        SlotState(Scheduler& scheduler, TransitionTimings timings)
        : transition(scheduler, timings) {}

        CharacterId          character_id = 0;
        std::string          character_name;
        std::string          resolved_url;
        int                  display_order = 0;
        bool                 is_current_speaker = false;
        bool                 loading = false;
        std::uint64_t        generation = 0;
        CancellationSource   lifetime;
        TransitionController transition;
    };

    void request_resolution(SlotState& slot, const Character& character, const std::string& emotion);
    void apply_resolution(CharacterId id, std::uint64_t generation, const Resolution& resolution);
    SpriteSlot snapshot(const SlotState& slot, std::uint64_t now_ms) const;

    SpriteResolver&    resolver_;
    Scheduler&         scheduler_;
    TransitionTimings  timings_;
    std::map<CharacterId, std::unique_ptr<SlotState>> slots_;
};

}

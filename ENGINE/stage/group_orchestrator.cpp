#include "group_orchestrator.hpp"

#include <algorithm>
#include <unordered_set>

#include "model/group_roster.hpp"
#include "utils/log.hpp"

namespace vnstage {

GroupOrchestrator::GroupOrchestrator(SpriteResolver& resolver, Scheduler& scheduler, TransitionTimings timings)
: resolver_(resolver), scheduler_(scheduler), timings_(timings) {}

GroupOrchestrator::~GroupOrchestrator() {
    clear();
}

bool GroupOrchestrator::is_speaker(CharacterId member_id, const Message* message) {
    return message && message->sender == Sender::Character &&
           message->speaker_id && *message->speaker_id == member_id;
}

std::string GroupOrchestrator::target_emotion_for(CharacterId member_id,
                                                  const Message* message,
                                                  const std::string& default_emotion) {
    if (is_speaker(member_id, message) && message->emotion && !message->emotion->empty()) {
        return *message->emotion;
    }
    return default_emotion;
}

void GroupOrchestrator::update(const std::vector<GroupMember>& members,
                               const std::vector<Character>& roster,
                               const Message* message) {
    const std::vector<GroupMember> ordered = roster::ordered_members(members);

    std::unordered_set<CharacterId> live;
    for (const auto& member : ordered) {
        const Character* character = find_character(roster, member.character_id);
        if (!character) {
            vnstage::log::warn("[GroupOrchestrator] Member #" + std::to_string(member.character_id) +
                               " has no character record; omitting its slot.");
            continue;
        }
        if (!live.insert(member.character_id).second) {
            vnstage::log::warn("[GroupOrchestrator] Member #" + std::to_string(member.character_id) +
                               " listed twice; keeping the first entry.");
            continue;
        }

        auto it = slots_.find(member.character_id);
        if (it == slots_.end()) {
            auto slot = std::make_unique<SlotState>(scheduler_, timings_);
            slot->character_id = member.character_id;
            slot->resolved_url = resolver_.static_fallback(*character).url;
            it = slots_.emplace(member.character_id, std::move(slot)).first;
        }

        SlotState& slot = *it->second;
        slot.character_name = character->name;
        slot.display_order = member.display_order;
        slot.is_current_speaker = is_speaker(member.character_id, message);

        request_resolution(slot, *character,
                           target_emotion_for(member.character_id, message, resolver_.default_emotion()));
    }

    for (auto it = slots_.begin(); it != slots_.end();) {
        if (live.count(it->first) == 0) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

void GroupOrchestrator::request_resolution(SlotState& slot, const Character& character, const std::string& emotion) {
    const std::uint64_t generation = ++slot.generation;
    const CharacterId id = slot.character_id;
    const CancellationToken token = slot.lifetime.token();
    slot.loading = true;

    resolver_.resolve(character, emotion, [this, id, generation, token](const Resolution& resolution) {
        if (token.cancelled()) {
            vnstage::log::debug("[GroupOrchestrator] Discarding result for removed slot #" + std::to_string(id) + ".");
            return;
        }
        apply_resolution(id, generation, resolution);
    });
}

void GroupOrchestrator::apply_resolution(CharacterId id, std::uint64_t generation, const Resolution& resolution) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return;
    }
    SlotState& slot = *it->second;
    if (generation != slot.generation) {
        vnstage::log::debug("[GroupOrchestrator] Discarding stale result " + std::to_string(generation) +
                            " for slot #" + std::to_string(id) + " (current " + std::to_string(slot.generation) + ").");
        return;
    }
    slot.loading = false;
    slot.resolved_url = resolution.url;
    slot.transition.set_resolved_url(resolution.url);
    vnstage::log::debug("[GroupOrchestrator] Slot #" + std::to_string(id) + " resolved via " +
                        to_string(resolution.tier) + ": " + resolution.url);
}

void GroupOrchestrator::clear() {
    for (auto& entry : slots_) {
        entry.second->lifetime.cancel();
        entry.second->transition.cancel();
    }
    slots_.clear();
}

SpriteSlot GroupOrchestrator::snapshot(const SlotState& slot, std::uint64_t now_ms) const {
    SpriteSlot out;
    out.character_id = slot.character_id;
    out.character_name = slot.character_name;
    out.resolved_url = slot.resolved_url;
    out.display_url = slot.transition.display_url();
    out.fade_state = slot.transition.fade_state();
    out.display_order = slot.display_order;
    out.is_current_speaker = slot.is_current_speaker;
    out.loading = slot.loading;
    out.fade_progress = slot.transition.phase_progress(now_ms);
    return out;
}

std::vector<SpriteSlot> GroupOrchestrator::slots() const {
    return slots(scheduler_.now());
}

std::vector<SpriteSlot> GroupOrchestrator::slots(std::uint64_t now_ms) const {
    std::vector<SpriteSlot> out;
    out.reserve(slots_.size());
    for (const auto& entry : slots_) {
        out.push_back(snapshot(*entry.second, now_ms));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const SpriteSlot& a, const SpriteSlot& b) { return a.display_order < b.display_order; });
    return out;
}

bool GroupOrchestrator::any_loading() const {
    return std::any_of(slots_.begin(), slots_.end(),
                       [](const auto& entry) { return entry.second->loading; });
}

const TransitionController* GroupOrchestrator::transition_for(CharacterId id) const {
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : &it->second->transition;
}

}

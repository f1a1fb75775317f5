#include "group_roster.hpp"

#include <algorithm>
#include <unordered_set>

namespace vnstage::roster {

std::vector<GroupMember> ordered_members(const std::vector<GroupMember>& members) {
    std::vector<GroupMember> ordered = members;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const GroupMember& a, const GroupMember& b) { return a.display_order < b.display_order; });
    return ordered;
}

std::vector<std::string> validate_group(const Group& group) {
    std::vector<std::string> errors;
    if (group.members.size() < 2) {
        errors.emplace_back("Group chat must have at least 2 members");
    }

    std::unordered_set<CharacterId> seen;
    for (const auto& member : group.members) {
        if (!seen.insert(member.character_id).second) {
            errors.emplace_back("Group chat contains duplicate members");
            break;
        }
    }

    for (const auto& member : group.members) {
        if (member.response_probability < 0 || member.response_probability > 100) {
            errors.push_back("Invalid probability for member " + std::to_string(member.character_id) +
                             ": " + std::to_string(member.response_probability));
        }
    }
    return errors;
}

}

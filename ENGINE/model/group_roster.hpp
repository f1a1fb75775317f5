#pragma once

#include <string>
#include <vector>

#include "records.hpp"

namespace vnstage::roster {

// Members sorted by display order, ties keep their stored order.
std::vector<GroupMember> ordered_members(const std::vector<GroupMember>& members);

std::vector<std::string> validate_group(const Group& group);

}

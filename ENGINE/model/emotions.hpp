#pragma once

#include <string>
#include <vector>

namespace vnstage::emotions {

inline constexpr const char* kNeutral = "neutral";

// Labels the upstream classifier emits, plus the class default. Tags stay free-form;
// this list is only used for diagnostics.
const std::vector<std::string>& known_emotions();
bool is_known_emotion(const std::string& tag);

}

#include "emotions.hpp"

#include <algorithm>

namespace vnstage::emotions {

const std::vector<std::string>& known_emotions() {
    static const std::vector<std::string> tags{
        "sadness", "joy", "love", "anger", "fear", "surprise", kNeutral,
    };
    return tags;
}

bool is_known_emotion(const std::string& tag) {
    const auto& tags = known_emotions();
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

}

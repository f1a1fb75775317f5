#include "records.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace vnstage {
namespace {

std::optional<std::int64_t> read_id(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<std::int64_t>();
    if (it->is_number_float()) return static_cast<std::int64_t>(it->get<double>());
    return std::nullopt;
}

std::string read_string(const nlohmann::json& j, const char* key, const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

std::optional<std::string> read_optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

}

const char* to_string(Sender sender) {
    switch (sender) {
        case Sender::User:      return "user";
        case Sender::Character: return "character";
        case Sender::System:    return "system";
    }
    return "system";
}

Sender parse_sender(const std::string& text) {
    if (text == "user") return Sender::User;
    if (text == "character") return Sender::Character;
    return Sender::System;
}

std::optional<Sprite> parse_sprite(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    Sprite sprite;
    sprite.emotion = read_string(j, "emotion");
    sprite.filename = read_string(j, "filename");
    if (sprite.filename.empty()) return std::nullopt;
    return sprite;
}

std::optional<Character> parse_character(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto id = read_id(j, "id");
    if (!id) return std::nullopt;

    Character character;
    character.id = *id;
    character.name = read_string(j, "name");
    character.image = read_string(j, "image");
    auto sprites_it = j.find("sprites");
    if (sprites_it != j.end() && sprites_it->is_array()) {
        for (const auto& entry : *sprites_it) {
            if (auto sprite = parse_sprite(entry)) {
                character.sprites.push_back(std::move(*sprite));
            }
        }
    }
    return character;
}

std::optional<GroupMember> parse_group_member(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto id = read_id(j, "characterId");
    if (!id) return std::nullopt;

    GroupMember member;
    member.character_id = *id;
    if (auto order = read_id(j, "displayOrder"); order && *order >= 0) {
        member.display_order = static_cast<int>(*order);
    }
    if (auto probability = read_id(j, "responseProbability")) {
        member.response_probability = static_cast<int>(std::clamp<std::int64_t>(*probability, 0, 100));
    }
    return member;
}

std::optional<Group> parse_group(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto id = read_id(j, "id");
    if (!id) return std::nullopt;

    Group group;
    group.id = *id;
    group.name = read_string(j, "name");
    auto members_it = j.find("members");
    if (members_it != j.end() && members_it->is_array()) {
        for (const auto& entry : *members_it) {
            if (auto member = parse_group_member(entry)) {
                group.members.push_back(*member);
            }
        }
    }
    return group;
}

std::optional<Message> parse_message(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    Message message;
    message.id = read_id(j, "id").value_or(0);
    message.sender = parse_sender(read_string(j, "sender", "system"));
    message.text = read_string(j, "text");
    message.speaker_id = read_id(j, "speakerId");
    message.speaker_name = read_optional_string(j, "speakerName");
    message.emotion = read_optional_string(j, "emotion");
    auto generating = j.find("isGenerating");
    message.is_generating = generating != j.end() && generating->is_boolean() && generating->get<bool>();
    return message;
}

const Character* find_character(const std::vector<Character>& roster, CharacterId id) {
    auto it = std::find_if(roster.begin(), roster.end(),
                           [id](const Character& c) { return c.id == id; });
    return it == roster.end() ? nullptr : &*it;
}

}

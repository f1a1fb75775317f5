#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace vnstage {

using CharacterId = std::int64_t;

struct Sprite {
    std::string emotion;
    std::string filename;
};

struct Character {
    CharacterId         id = 0;
    std::string         name;
    std::string         image;
    std::vector<Sprite> sprites;
};

struct GroupMember {
    CharacterId character_id = 0;
    int         display_order = 0;
    int         response_probability = 50;
};

struct Group {
    CharacterId              id = 0;
    std::string              name;
    std::vector<GroupMember> members;
};

enum class Sender {
    User,
    Character,
    System,
};

struct Message {
    std::int64_t               id = 0;
    Sender                     sender = Sender::System;
    std::string                text;
    std::optional<CharacterId> speaker_id;
    std::optional<std::string> speaker_name;
    std::optional<std::string> emotion;
    bool                       is_generating = false;
};

const char* to_string(Sender sender);
Sender parse_sender(const std::string& text);

// Parsers skip malformed records by returning nullopt; callers decide whether to log.
std::optional<Sprite> parse_sprite(const nlohmann::json& j);
std::optional<Character> parse_character(const nlohmann::json& j);
std::optional<GroupMember> parse_group_member(const nlohmann::json& j);
std::optional<Group> parse_group(const nlohmann::json& j);
std::optional<Message> parse_message(const nlohmann::json& j);

const Character* find_character(const std::vector<Character>& roster, CharacterId id);

}

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/stage_settings.hpp"
#include "model/records.hpp"

namespace session {

struct ChatData {
    vnstage::CharacterId          active_id = 0;
    std::vector<vnstage::Message> messages;
};

struct SessionData {
    vnstage::StageSettings          settings;
    std::vector<vnstage::Character> characters;
    std::vector<vnstage::Group>     groups;
    ChatData                        chat;
    std::filesystem::path           base_dir;
    nlohmann::json                  raw;

    const vnstage::Group* find_group(vnstage::CharacterId id) const;
};

std::string default_session_path();

// Throws std::runtime_error when the file cannot be read or is not valid JSON.
SessionData load_session(const std::filesystem::path& path);

// Same as load_session but from an already parsed document. Relative paths resolve
// against base_dir.
SessionData parse_session(const nlohmann::json& document, const std::filesystem::path& base_dir);

vnstage::StageSettings parse_settings(const nlohmann::json& settings_json, const std::filesystem::path& base_dir);

}

#include "core/session_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace session {
namespace {

std::optional<std::uint64_t> read_positive_ms(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    const double value = it->get<double>();
    if (!(value >= 0.0)) return std::nullopt;
    return static_cast<std::uint64_t>(value);
}

std::string resolve_path(const std::string& value, const fs::path& base_dir) {
    if (value.empty() || vnstage::strings::starts_with(value, "builtin://") ||
        vnstage::strings::starts_with(value, "file://")) {
        return value;
    }
    fs::path p(value);
    if (p.is_relative() && !base_dir.empty()) {
        p = base_dir / p;
    }
    return p.lexically_normal().generic_string();
}

void apply_env_overrides(vnstage::StageSettings& settings) {
    const char* v = std::getenv("VNSTAGE_FADE_MS");
    if (!v || !*v) return;
    char* end = nullptr;
    const long ms = std::strtol(v, &end, 10);
    if (end == v || ms <= 0) {
        vnstage::log::warn(std::string("[Session] Ignoring VNSTAGE_FADE_MS='") + v + "'.");
        return;
    }
    settings.timings.fade_out_ms = static_cast<std::uint64_t>(ms);
    settings.timings.fade_in_ms = static_cast<std::uint64_t>(ms);
    vnstage::log::info("[Session] VNSTAGE_FADE_MS overrides fade durations to " + std::to_string(ms) + "ms.");
}

}

const vnstage::Group* SessionData::find_group(vnstage::CharacterId id) const {
    auto it = std::find_if(groups.begin(), groups.end(),
                           [id](const vnstage::Group& g) { return g.id == id; });
    return it == groups.end() ? nullptr : &*it;
}

std::string default_session_path() {
    return (fs::current_path() / "session.json").string();
}

vnstage::StageSettings parse_settings(const nlohmann::json& settings_json, const fs::path& base_dir) {
    vnstage::StageSettings settings;
    if (settings_json.is_object()) {
        if (auto ms = read_positive_ms(settings_json, "fade_out_ms")) settings.timings.fade_out_ms = *ms;
        if (auto ms = read_positive_ms(settings_json, "fade_in_ms")) settings.timings.fade_in_ms = *ms;

        auto emotion_it = settings_json.find("default_emotion");
        if (emotion_it != settings_json.end() && emotion_it->is_string()) {
            const std::string emotion = vnstage::strings::trim_copy(emotion_it->get<std::string>());
            if (!emotion.empty()) settings.default_emotion = emotion;
        }

        auto placeholder_it = settings_json.find("placeholder");
        if (placeholder_it != settings_json.end() && placeholder_it->is_string()) {
            const std::string value = placeholder_it->get<std::string>();
            if (!value.empty()) settings.placeholder_url = resolve_path(value, base_dir);
        }

        auto root_it = settings_json.find("characters_root");
        if (root_it != settings_json.end() && root_it->is_string() && !root_it->get_ref<const std::string&>().empty()) {
            settings.characters_root = root_it->get<std::string>();
        }

        auto window_it = settings_json.find("window");
        if (window_it != settings_json.end() && window_it->is_object()) {
            settings.window_width = std::max(320, window_it->value("width", settings.window_width));
            settings.window_height = std::max(240, window_it->value("height", settings.window_height));
        }

        auto level_it = settings_json.find("log_level");
        if (level_it != settings_json.end() && level_it->is_string() && !std::getenv("VNSTAGE_LOG_LEVEL")) {
            if (auto level = vnstage::log::parse_level(level_it->get<std::string>())) {
                vnstage::log::set_level(*level);
            }
        }
    }
    settings.characters_root = resolve_path(settings.characters_root, base_dir);
    apply_env_overrides(settings);
    return settings;
}

SessionData parse_session(const nlohmann::json& document, const fs::path& base_dir) {
    if (!document.is_object()) {
        throw std::runtime_error("Session document must be a JSON object.");
    }

    SessionData data;
    data.base_dir = base_dir;
    data.raw = document;
    data.settings = parse_settings(document.value("settings", nlohmann::json::object()), base_dir);

    auto characters_it = document.find("characters");
    if (characters_it != document.end() && characters_it->is_array()) {
        for (const auto& entry : *characters_it) {
            auto character = vnstage::parse_character(entry);
            if (!character) {
                vnstage::log::warn("[Session] Skipping malformed character record: " + entry.dump());
                continue;
            }
            if (!character->image.empty()) {
                character->image = resolve_path(character->image, base_dir);
            }
            data.characters.push_back(std::move(*character));
        }
    }

    auto groups_it = document.find("groups");
    if (groups_it != document.end() && groups_it->is_array()) {
        for (const auto& entry : *groups_it) {
            auto group = vnstage::parse_group(entry);
            if (!group) {
                vnstage::log::warn("[Session] Skipping malformed group record: " + entry.dump());
                continue;
            }
            data.groups.push_back(std::move(*group));
        }
    }

    auto chat_it = document.find("chat");
    if (chat_it != document.end() && chat_it->is_object()) {
        auto id_it = chat_it->find("characterId");
        if (id_it != chat_it->end() && id_it->is_number_integer()) {
            data.chat.active_id = id_it->get<vnstage::CharacterId>();
        }
        auto messages_it = chat_it->find("messages");
        if (messages_it != chat_it->end() && messages_it->is_array()) {
            for (const auto& entry : *messages_it) {
                if (auto message = vnstage::parse_message(entry)) {
                    data.chat.messages.push_back(std::move(*message));
                } else {
                    vnstage::log::warn("[Session] Skipping malformed message record.");
                }
            }
        }
    }

    vnstage::log::info("[Session] Loaded " + std::to_string(data.characters.size()) + " character(s), " +
                       std::to_string(data.groups.size()) + " group(s), " +
                       std::to_string(data.chat.messages.size()) + " message(s).");
    return data;
}

SessionData load_session(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::ostringstream oss;
        oss << "Session file '" << path.string() << "' does not exist.";
        throw std::runtime_error(oss.str());
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open session file '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }

    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        std::ostringstream oss;
        oss << "Session file '" << path.string() << "' is not valid JSON: " << ex.what();
        throw std::runtime_error(oss.str());
    }

    fs::path base_dir = fs::absolute(path, ec).parent_path();
    if (ec) {
        base_dir = path.parent_path();
    }
    return parse_session(document, base_dir);
}

}

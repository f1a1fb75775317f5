#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/session_loader.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

static fs::path test_root() {
    return fs::temp_directory_path() / "vnstage_session_tests";
}

static fs::path write_file(const std::string& name, const std::string& text) {
    const fs::path root = test_root();
    std::error_code ec;
    fs::create_directories(root, ec);
    const fs::path path = root / name;
    std::ofstream out(path);
    out << text;
    return path;
}

TEST_CASE("session loader reads settings, roster, groups and chat") {
    vnstage::log::set_level(vnstage::log::Level::Error);
    const nlohmann::json doc = {
        {"settings", {
            {"fade_out_ms", 120},
            {"fade_in_ms", 240},
            {"default_emotion", " joy "},
            {"characters_root", "art"},
            {"window", {{"width", 800}, {"height", 100}}},
        }},
        {"characters", nlohmann::json::array({
            {{"id", 1}, {"name", "Ava"}, {"image", "portraits/ava.png"}},
            {{"name", "no id"}},
            {{"id", 2}, {"name", "Bram"}},
        })},
        {"groups", nlohmann::json::array({
            {{"id", 10}, {"name", "Pair"}, {"members", nlohmann::json::array({
                {{"characterId", 1}, {"displayOrder", 0}},
                {{"characterId", 2}, {"displayOrder", 1}},
            })}},
        })},
        {"chat", {
            {"characterId", 10},
            {"messages", nlohmann::json::array({
                {{"sender", "user"}, {"text", "hi"}},
                {{"sender", "character"}, {"text", "hello"}, {"speakerId", 2}, {"emotion", "joy"}},
            })},
        }},
    };
    const fs::path path = write_file("session.json", doc.dump(2));

    const session::SessionData data = session::load_session(path);

    CHECK(data.settings.timings.fade_out_ms == 120);
    CHECK(data.settings.timings.fade_in_ms == 240);
    CHECK(data.settings.default_emotion == "joy");
    CHECK(data.settings.window_width == 800);
    CHECK(data.settings.window_height == 240);
    CHECK(data.settings.placeholder_url == vnstage::kBuiltinPlaceholderUrl);
    CHECK(fs::path(data.settings.characters_root).is_absolute());
    CHECK(fs::path(data.settings.characters_root).filename() == "art");

    REQUIRE(data.characters.size() == 2);
    CHECK(fs::path(data.characters[0].image).is_absolute());
    CHECK(data.characters[1].image.empty());

    REQUIRE(data.groups.size() == 1);
    CHECK(data.find_group(10) != nullptr);
    CHECK(data.find_group(1) == nullptr);

    CHECK(data.chat.active_id == 10);
    REQUIRE(data.chat.messages.size() == 2);
    CHECK(data.chat.messages[1].speaker_id.value_or(0) == 2);
}

TEST_CASE("session defaults apply when settings are absent") {
    const session::SessionData data = session::parse_session(nlohmann::json::object(), fs::path());
    CHECK(data.settings.default_emotion == "neutral");
    CHECK(data.settings.placeholder_url == vnstage::kBuiltinPlaceholderUrl);
    CHECK(data.characters.empty());
    CHECK(data.chat.messages.empty());
    CHECK(data.chat.active_id == 0);
}

TEST_CASE("builtin and file urls are not rebased") {
    const nlohmann::json settings = {{"placeholder", "file:///art/blank.png"}};
    const vnstage::StageSettings parsed = session::parse_settings(settings, fs::path("/base"));
    CHECK(parsed.placeholder_url == "file:///art/blank.png");
}

TEST_CASE("session loader rejects missing and malformed files") {
    vnstage::log::set_level(vnstage::log::Level::Error);
    CHECK_THROWS_AS(session::load_session(test_root() / "does_not_exist.json"), std::runtime_error);

    const fs::path broken = write_file("broken.json", "{\n\n");
    CHECK_THROWS_AS(session::load_session(broken), std::runtime_error);

    const fs::path not_object = write_file("array.json", "[1, 2, 3]");
    CHECK_THROWS_AS(session::load_session(not_object), std::runtime_error);
}

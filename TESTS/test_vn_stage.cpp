#include "doctest/doctest.h"

#include <cstdint>
#include <string>
#include <vector>

#include "stage/vn_stage.hpp"
#include "stubs/fake_sprite_repository.hpp"
#include "utils/log.hpp"

using namespace vnstage;

namespace {

Character make_character(CharacterId id, const std::string& name, const std::string& image = {}) {
    Character c;
    c.id = id;
    c.name = name;
    c.image = image;
    return c;
}

Group make_group(CharacterId id, const std::vector<CharacterId>& members) {
    Group g;
    g.id = id;
    g.name = "Circle";
    int order = 0;
    for (CharacterId m : members) {
        GroupMember gm;
        gm.character_id = m;
        gm.display_order = order++;
        g.members.push_back(gm);
    }
    return g;
}

void pump(VnStage& stage, std::uint64_t now) {
    for (int i = 0; i < 6; ++i) {
        stage.update(now);
    }
}

}

TEST_CASE("stage moves from idle through loading to ready") {
    log::set_level(log::Level::Error);
    FakeSpriteRepository repo;
    repo.auto_complete = false;
    repo.inventories[1] = {{"neutral", "n.png"}};
    VnStage stage(repo, StageSettings{});
    CHECK(stage.state() == StageState::Idle);

    const Character mira = make_character(1, "Mira");
    Message msg;
    msg.sender = Sender::Character;
    msg.text = "Morning.";
    stage.show_solo(mira, &msg);
    CHECK(stage.state() == StageState::Loading);
    CHECK(stage.mode() == StageMode::Solo);

    auto renderables = stage.renderables();
    REQUIRE(renderables.size() == 1);
    CHECK(renderables[0].loading);
    CHECK(renderables[0].image_url.empty());

    REQUIRE(repo.complete_scan(1));
    stage.update(0);
    REQUIRE(repo.complete_load(1));
    stage.update(0);

    CHECK(stage.state() == StageState::Ready);
    renderables = stage.renderables();
    REQUIRE(renderables.size() == 1);
    CHECK(renderables[0].image_url == FakeSpriteRepository::url_for(1, "n.png"));
    CHECK(renderables[0].current_speaker);
    CHECK(renderables[0].fade_class == "sprite-visible");
}

TEST_CASE("solo mode without a message shows the static portrait") {
    FakeSpriteRepository repo;
    VnStage stage(repo, StageSettings{});
    const Character mira = make_character(1, "Mira", "file:///portraits/mira.png");

    stage.show_solo(mira, nullptr);

    CHECK(stage.state() == StageState::Ready);
    const auto slots = stage.slots();
    REQUIRE(slots.size() == 1);
    CHECK(slots[0].display_url == "file:///portraits/mira.png");
    CHECK(repo.scan_calls == 0);
    CHECK(stage.scheduler().pending() == 0);
}

TEST_CASE("solo emotion changes fade through the configured timings") {
    FakeSpriteRepository repo;
    repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};
    StageSettings settings;
    settings.timings = TransitionTimings{100, 200};
    VnStage stage(repo, settings);
    const Character mira = make_character(1, "Mira");

    Message msg;
    msg.sender = Sender::Character;
    msg.emotion = "neutral";
    stage.show_solo(mira, &msg);
    pump(stage, 0);

    msg.emotion = "joy";
    stage.show_solo(mira, &msg);
    pump(stage, 0);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeOut);

    stage.update(100);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeIn);
    CHECK(stage.slots()[0].display_url == FakeSpriteRepository::url_for(1, "j.png"));

    stage.update(300);
    CHECK(stage.slots()[0].fade_state == FadeState::Visible);
}

TEST_CASE("group mode publishes one slot per resolvable member") {
    FakeSpriteRepository repo;
    VnStage stage(repo, StageSettings{});
    const std::vector<Character> roster = {make_character(1, "Ava"), make_character(2, "Bram")};
    const Group group = make_group(10, {1, 2, 3});

    Message msg;
    msg.sender = Sender::Character;
    msg.speaker_id = 2;
    stage.show_group(group, roster, &msg);
    pump(stage, 0);

    CHECK(stage.mode() == StageMode::Group);
    CHECK(stage.active_id() == 10);
    const auto renderables = stage.renderables();
    REQUIRE(renderables.size() == 2);
    CHECK(renderables[0].display_name == "Ava");
    CHECK(renderables[1].display_name == "Bram");
    CHECK(renderables[1].current_speaker);
    CHECK(renderables[0].image_url == kBuiltinPlaceholderUrl);
}

TEST_CASE("exit discards slots, pending timers and late results") {
    FakeSpriteRepository repo;
    repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};
    VnStage stage(repo, StageSettings{});
    const Character mira = make_character(1, "Mira");
    Message msg;
    msg.sender = Sender::Character;
    msg.emotion = "neutral";
    stage.show_solo(mira, &msg);
    pump(stage, 0);
    msg.emotion = "joy";
    stage.show_solo(mira, &msg);
    pump(stage, 0);
    REQUIRE(stage.scheduler().pending() == 1);

    repo.auto_complete = false;
    msg.emotion = "neutral";
    stage.show_solo(mira, &msg);
    stage.exit();

    CHECK(stage.state() == StageState::Idle);
    CHECK(stage.mode() == StageMode::None);
    CHECK(stage.slots().empty());
    CHECK(stage.scheduler().pending() == 0);

    REQUIRE(repo.complete_scan(1));
    pump(stage, 1000);
    CHECK(stage.slots().empty());
}

TEST_CASE("switching the active character starts from a clean slate") {
    FakeSpriteRepository repo;
    VnStage stage(repo, StageSettings{});
    Message msg;
    msg.sender = Sender::Character;
    stage.show_solo(make_character(1, "Mira", "file:///mira.png"), &msg);
    pump(stage, 0);

    stage.show_solo(make_character(2, "Tom", "file:///tom.png"), &msg);
    pump(stage, 0);

    const auto slots = stage.slots();
    REQUIRE(slots.size() == 1);
    CHECK(slots[0].character_id == 2);
    CHECK(slots[0].display_url == "file:///tom.png");
    CHECK(slots[0].fade_state == FadeState::Visible);
}

TEST_CASE("speaker label names the user or the speaking character") {
    FakeSpriteRepository repo;
    VnStage stage(repo, StageSettings{});
    const std::vector<Character> roster = {make_character(1, "Ava"), make_character(2, "Bram")};
    stage.show_group(make_group(10, {1, 2}), roster, nullptr);

    Message user;
    user.sender = Sender::User;
    CHECK(stage.speaker_label(user) == "You");

    Message bram;
    bram.sender = Sender::Character;
    bram.speaker_id = 2;
    CHECK(stage.speaker_label(bram) == "Bram");

    Message stranger;
    stranger.sender = Sender::Character;
    stranger.speaker_id = 42;
    stranger.speaker_name = std::string("Visitor");
    CHECK(stage.speaker_label(stranger) == "Visitor");

    stage.show_solo(roster[0], nullptr);
    CHECK(stage.speaker_label(bram) == "Ava");
}

TEST_CASE("fade dwells are measured from the frame that applied the result") {
    FakeSpriteRepository repo;
    repo.auto_complete = false;
    repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};
    VnStage stage(repo, StageSettings{});
    const Character mira = make_character(1, "Mira");

    Message msg;
    msg.sender = Sender::Character;
    msg.emotion = "neutral";
    stage.show_solo(mira, &msg);
    REQUIRE(repo.complete_scan(1));
    stage.update(1000);
    REQUIRE(repo.complete_load(1));
    stage.update(1032);
    REQUIRE(stage.slots()[0].display_url == FakeSpriteRepository::url_for(1, "n.png"));

    msg.emotion = "joy";
    stage.show_solo(mira, &msg);
    REQUIRE(repo.complete_scan(1));
    stage.update(1100);
    REQUIRE(repo.complete_load(1));

    // A long stall before the frame that applies the result.
    stage.update(1780);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeOut);
    CHECK(stage.slots()[0].display_url == FakeSpriteRepository::url_for(1, "n.png"));

    stage.update(2064);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeOut);
    CHECK(stage.slots()[0].display_url == FakeSpriteRepository::url_for(1, "n.png"));

    stage.update(2080);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeIn);
    CHECK(stage.slots()[0].display_url == FakeSpriteRepository::url_for(1, "j.png"));

    stage.update(2379);
    CHECK(stage.slots()[0].fade_state == FadeState::FadeIn);

    stage.update(2380);
    CHECK(stage.slots()[0].fade_state == FadeState::Visible);
}

TEST_CASE("a revealed slot shows the loading card while its next resolution is pending") {
    FakeSpriteRepository repo;
    repo.auto_complete = false;
    repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};
    repo.inventories[2] = {{"neutral", "b.png"}};
    VnStage stage(repo, StageSettings{});
    const std::vector<Character> roster = {make_character(1, "Ava"), make_character(2, "Bram")};
    const Group group = make_group(10, {1, 2});

    stage.show_group(group, roster, nullptr);
    auto renderables = stage.renderables();
    REQUIRE(renderables.size() == 2);
    CHECK(shows_loading_card(renderables[0]));
    CHECK(shows_loading_card(renderables[1]));

    for (CharacterId id : {1, 2}) {
        REQUIRE(repo.complete_scan(id));
    }
    stage.update(0);
    for (CharacterId id : {1, 2}) {
        REQUIRE(repo.complete_load(id));
    }
    stage.update(0);
    renderables = stage.renderables();
    CHECK_FALSE(shows_loading_card(renderables[0]));
    CHECK_FALSE(shows_loading_card(renderables[1]));

    Message msg;
    msg.sender = Sender::Character;
    msg.speaker_id = 1;
    msg.emotion = "joy";
    stage.show_group(group, roster, &msg);
    renderables = stage.renderables();
    CHECK(stage.state() == StageState::Loading);
    CHECK(shows_loading_card(renderables[0]));
    CHECK(shows_loading_card(renderables[1]));

    REQUIRE(repo.complete_scan(2));
    stage.update(10);
    REQUIRE(repo.complete_load(2));
    stage.update(20);
    renderables = stage.renderables();
    CHECK(shows_loading_card(renderables[0]));
    CHECK_FALSE(shows_loading_card(renderables[1]));
    CHECK(renderables[1].image_url == FakeSpriteRepository::url_for(2, "b.png"));
}

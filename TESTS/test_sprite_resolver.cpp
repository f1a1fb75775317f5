#include "doctest/doctest.h"

#include <optional>
#include <string>
#include <vector>

#include "core/async_completion_queue.hpp"
#include "core/stage_settings.hpp"
#include "sprites/sprite_resolver.hpp"
#include "stubs/fake_sprite_repository.hpp"
#include "utils/log.hpp"

using vnstage::Character;
using vnstage::Resolution;
using vnstage::ResolutionTier;
using vnstage::Sprite;

namespace {

Character make_character(vnstage::CharacterId id, const std::string& name, const std::string& image = {}) {
    Character c;
    c.id = id;
    c.name = name;
    c.image = image;
    return c;
}

struct ResolverFixture {
    ResolverFixture()
    : resolver(repo, queue, "neutral", "") {
        vnstage::log::set_level(vnstage::log::Level::Error);
    }

    std::optional<Resolution> resolve(const Character& character, const std::string& emotion) {
        std::optional<Resolution> out;
        int calls = 0;
        resolver.resolve(character, emotion, [&](const Resolution& r) {
            ++calls;
            out = r;
        });
        for (int i = 0; i < 4 && queue.is_busy(); ++i) {
            queue.update();
        }
        CHECK(calls <= 1);
        return out;
    }

    FakeSpriteRepository repo;
    vnstage::AsyncCompletionQueue queue;
    vnstage::SpriteResolver resolver;
};

}

TEST_CASE("resolver falls back to the class default when the requested emotion is missing") {
    ResolverFixture f;
    const Character mira = make_character(1, "Mira");
    f.repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};

    auto result = f.resolve(mira, "anger");

    REQUIRE(result.has_value());
    CHECK(result->url == FakeSpriteRepository::url_for(1, "n.png"));
    CHECK(result->tier == ResolutionTier::DefaultEmotion);
}

TEST_CASE("resolver prefers an exact emotion match") {
    ResolverFixture f;
    const Character mira = make_character(1, "Mira");
    f.repo.inventories[1] = {{"neutral", "n.png"}, {"joy", "j.png"}};

    auto result = f.resolve(mira, "joy");

    REQUIRE(result.has_value());
    CHECK(result->url == FakeSpriteRepository::url_for(1, "j.png"));
    CHECK(result->tier == ResolutionTier::ExactMatch);
}

TEST_CASE("resolver uses the first sprite when neither tag matches") {
    ResolverFixture f;
    const Character mira = make_character(1, "Mira");
    f.repo.inventories[1] = {{"fear", "f.png"}, {"love", "l.png"}};

    auto result = f.resolve(mira, "anger");

    REQUIRE(result.has_value());
    CHECK(result->url == FakeSpriteRepository::url_for(1, "f.png"));
    CHECK(result->tier == ResolutionTier::FirstSprite);
}

TEST_CASE("resolver shows the portrait when the inventory is empty") {
    ResolverFixture f;
    const Character mira = make_character(1, "Mira", "file:///portraits/mira.png");

    auto result = f.resolve(mira, "joy");

    REQUIRE(result.has_value());
    CHECK(result->url == "file:///portraits/mira.png");
    CHECK(result->tier == ResolutionTier::Portrait);
    CHECK(f.repo.load_calls == 0);
}

TEST_CASE("resolver returns the built-in placeholder with no sprites and no portrait") {
    ResolverFixture f;
    const Character nobody = make_character(7, "Nobody");

    auto result = f.resolve(nobody, "joy");

    REQUIRE(result.has_value());
    CHECK(result->url == vnstage::kBuiltinPlaceholderUrl);
    CHECK(result->tier == ResolutionTier::Placeholder);
}

TEST_CASE("resolver treats a storage failure during the scan as no sprites") {
    ResolverFixture f;
    f.repo.scan_storage_error = true;
    const Character mira = make_character(1, "Mira", "file:///portraits/mira.png");

    auto result = f.resolve(mira, "joy");

    REQUIRE(result.has_value());
    CHECK(result->url == "file:///portraits/mira.png");
    CHECK(result->tier == ResolutionTier::Portrait);
}

TEST_CASE("resolver survives a repository that throws before returning a future") {
    ResolverFixture f;
    f.repo.scan_throws = true;
    const Character nobody = make_character(2, "Nobody");

    auto result = f.resolve(nobody, "joy");

    REQUIRE(result.has_value());
    CHECK(result->tier == ResolutionTier::Placeholder);
    CHECK_FALSE(f.queue.is_busy());
}

TEST_CASE("resolver falls back when the chosen sprite cannot be materialized") {
    ResolverFixture f;
    f.repo.load_storage_error = true;
    f.repo.inventories[1] = {{"joy", "j.png"}};
    const Character mira = make_character(1, "Mira", "file:///portraits/mira.png");

    auto result = f.resolve(mira, "joy");

    REQUIRE(result.has_value());
    CHECK(result->url == "file:///portraits/mira.png");
}

TEST_CASE("resolver refreshes the inventory on every call") {
    ResolverFixture f;
    const Character mira = make_character(1, "Mira");
    f.repo.inventories[1] = {{"neutral", "n.png"}};
    f.resolve(mira, "neutral");

    f.repo.inventories[1] = {{"neutral", "n2.png"}};
    auto result = f.resolve(mira, "neutral");

    CHECK(f.repo.scan_calls == 2);
    REQUIRE(result.has_value());
    CHECK(result->url == FakeSpriteRepository::url_for(1, "n2.png"));
}

TEST_CASE("resolver does not answer until the repository completes") {
    ResolverFixture f;
    f.repo.auto_complete = false;
    f.repo.inventories[1] = {{"joy", "j.png"}};
    const Character mira = make_character(1, "Mira");

    int calls = 0;
    std::string url;
    f.resolver.resolve(mira, "joy", [&](const Resolution& r) {
        ++calls;
        url = r.url;
    });
    f.queue.update();
    CHECK(calls == 0);

    REQUIRE(f.repo.complete_scan(1));
    f.queue.update();
    CHECK(calls == 0);
    REQUIRE(f.repo.loads.size() == 1);
    CHECK(f.repo.loads[0].filename == "j.png");

    REQUIRE(f.repo.complete_load(1));
    f.queue.update();
    CHECK(calls == 1);
    CHECK(url == FakeSpriteRepository::url_for(1, "j.png"));
}

TEST_CASE("select_sprite walks exact, default, then first") {
    const std::vector<Sprite> sprites = {{"surprise", "s.png"}, {"neutral", "n.png"}};
    ResolutionTier tier = ResolutionTier::Placeholder;

    const Sprite* exact = vnstage::SpriteResolver::select_sprite(sprites, "surprise", "neutral", &tier);
    REQUIRE(exact != nullptr);
    CHECK(exact->filename == "s.png");
    CHECK(tier == ResolutionTier::ExactMatch);

    const Sprite* fallback = vnstage::SpriteResolver::select_sprite(sprites, "", "neutral", &tier);
    REQUIRE(fallback != nullptr);
    CHECK(fallback->filename == "n.png");
    CHECK(tier == ResolutionTier::DefaultEmotion);

    const Sprite* first = vnstage::SpriteResolver::select_sprite(sprites, "anger", "joy", &tier);
    REQUIRE(first != nullptr);
    CHECK(first->filename == "s.png");
    CHECK(tier == ResolutionTier::FirstSprite);

    CHECK(vnstage::SpriteResolver::select_sprite({}, "joy", "neutral") == nullptr);
}

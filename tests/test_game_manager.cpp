#include <doctest/doctest.h>
#include "game/GameManager.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std::chrono_literals;

namespace {
    constexpr float kDt = 0.1f;

    // joins `id` and pins it at `pos` with `score`
    void place(GameManager& gm, PlayerID id, const std::string& name, glm::vec2 pos, uint64_t score) {
        REQUIRE(gm.addPlayer(id, name).result == JoinResult::Joined);
        REQUIRE(gm.applyAuthoritativeState(id, pos, score));
    }

    ServerPlayer player(const GameManager& gm, PlayerID id) {
        std::optional<ServerPlayer> p = gm.getPlayerCopy(id);
        REQUIRE(p.has_value());
        return *p;
    }
}

TEST_SUITE("game_manager") {

TEST_CASE("player names") {
    CHECK(isValidPlayerName("abc"));
    CHECK(isValidPlayerName("Blob_Master-99"));
    CHECK(isValidPlayerName(std::string(20, 'x')));
    CHECK_FALSE(isValidPlayerName("ab"));
    CHECK_FALSE(isValidPlayerName(std::string(21, 'x')));
    CHECK_FALSE(isValidPlayerName("bad name"));
    CHECK_FALSE(isValidPlayerName("caf\xc3\xa9"));
}

TEST_CASE("join rules") {
    ServerConfig cfg = makeTestConfig();
    cfg.game.maxPlayers = 2;
    GameManager gm(cfg);

    const JoinOutcome first = gm.addPlayer(1, "alice");
    CHECK(first.result == JoinResult::Joined);
    CHECK(first.spawnPosition.x >= cfg.player.startRadius);
    CHECK(first.spawnPosition.x <= cfg.world.width - cfg.player.startRadius);

    CHECK(gm.addPlayer(2, "al").result == JoinResult::InvalidName);
    CHECK(gm.addPlayer(2, "alice").result == JoinResult::NameTaken);
    CHECK(gm.addPlayer(1, "other").result == JoinResult::NameTaken);
    CHECK(gm.addPlayer(2, "bob").result == JoinResult::Joined);
    CHECK(gm.addPlayer(3, "carol").result == JoinResult::ServerFull);
    CHECK(gm.playerCount() == 2);

    const ServerPlayer alice = player(gm, 1);
    CHECK(alice.score == 0);
    CHECK(alice.radius == doctest::Approx(cfg.player.startRadius));
    CHECK(alice.alive);

    CHECK(gm.removePlayer(1));
    CHECK_FALSE(gm.removePlayer(1));
    CHECK(gm.addPlayer(3, "carol").result == JoinResult::Joined);
}

TEST_CASE("name suggestions are free and valid") {
    GameManager gm(makeTestConfig());
    REQUIRE(gm.addPlayer(1, "alice").result == JoinResult::Joined);
    REQUIRE(gm.addPlayer(2, "alice1").result == JoinResult::Joined);

    const std::vector<std::string> s = gm.suggestNames("alice");
    CHECK(s.size() == 3);
    for (const std::string& name : s) {
        CHECK(isValidPlayerName(name));
        CHECK(name != "alice");
        CHECK(name != "alice1");
    }

    const std::vector<std::string> longName = gm.suggestNames(std::string(20, 'z'));
    REQUIRE_FALSE(longName.empty());
    CHECK(longName.front().size() <= kMaxNameLength);
    CHECK(isValidPlayerName(longName.front()));
}

TEST_CASE("growth and speed curves") {
    GameManager gm(makeTestConfig());
    CHECK(gm.radiusForScore(0) == doctest::Approx(20.0f));
    CHECK(gm.radiusForScore(30) == doctest::Approx(50.0f));
    CHECK(gm.radiusForScore(1000000000ull) == doctest::Approx(400.0f));

    CHECK(gm.speedForRadius(20.0f) == doctest::Approx(240.0f));
    CHECK(gm.speedForRadius(80.0f) == doctest::Approx(120.0f));
    // floor
    CHECK(gm.speedForRadius(400.0f) == doctest::Approx(60.0f));
}

TEST_CASE("move intents respect sequence order") {
    GameManager gm(makeTestConfig());
    REQUIRE(gm.addPlayer(1, "alice").result == JoinResult::Joined);

    CHECK(gm.recordMoveIntent(1, 1.0f, 0.0f, 0));
    CHECK_FALSE(gm.recordMoveIntent(1, 1.0f, 0.0f, 0));
    CHECK(gm.recordMoveIntent(1, 1.0f, 0.0f, 5));
    CHECK_FALSE(gm.recordMoveIntent(1, 0.0f, 1.0f, 5));
    CHECK_FALSE(gm.recordMoveIntent(1, 0.0f, 1.0f, 4));
    CHECK(gm.recordMoveIntent(1, 0.0f, 1.0f, 6));
    CHECK_FALSE(gm.recordMoveIntent(99, 0.0f, 1.0f, 7));
}

TEST_CASE("movement is normalized and consumed by the tick") {
    GameManager gm(makeTestConfig());
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "alice", { 500.0f, 500.0f }, 0);

    REQUIRE(gm.recordMoveIntent(1, 3.0f, 0.0f, 1));
    gm.tick(kDt, t0);
    ServerPlayer p = player(gm, 1);
    CHECK(p.position.x == doctest::Approx(524.0f));
    CHECK(p.position.y == doctest::Approx(500.0f));

    // no new intent: stays put
    gm.tick(kDt, t0 + 100ms);
    p = player(gm, 1);
    CHECK(p.position.x == doctest::Approx(524.0f));
}

TEST_CASE("non-finite intent is treated as no movement") {
    GameManager gm(makeTestConfig());
    place(gm, 1, "alice", { 500.0f, 500.0f }, 0);

    CHECK(gm.recordMoveIntent(1, std::numeric_limits<float>::quiet_NaN(), 1.0f, 1));
    gm.tick(kDt, Clock::now());
    const ServerPlayer p = player(gm, 1);
    CHECK(p.position.x == doctest::Approx(500.0f));
    CHECK(p.position.y == doctest::Approx(500.0f));
}

TEST_CASE("movement stops at the world edge") {
    GameManager gm(makeTestConfig());
    place(gm, 1, "alice", { 30.0f, 500.0f }, 0);
    REQUIRE(gm.recordMoveIntent(1, -1.0f, 0.0f, 1));
    gm.tick(kDt, Clock::now());
    CHECK(player(gm, 1).position.x == doctest::Approx(20.0f));
}

TEST_CASE("eating food grows the player") {
    GameManager gm(makeTestConfig());
    place(gm, 1, "alice", { 500.0f, 500.0f }, 0);
    gm.clearFood();
    gm.spawnFoodAt({ 505.0f, 500.0f }, 10);
    const FoodID far = gm.spawnFoodAt({ 900.0f, 900.0f }, 3);
    REQUIRE(gm.foodCount() == 2);

    gm.tick(kDt, Clock::now());
    const ServerPlayer p = player(gm, 1);
    CHECK(p.score == 10);
    CHECK(p.radius == doctest::Approx(30.0f));
    const std::vector<Food> food = gm.getFoodCopy();
    REQUIRE(food.size() == 1);
    CHECK(food[0].id == far);
}

TEST_CASE("larger player eats a smaller overlapping one and the victim respawns") {
    ServerConfig cfg = makeTestConfig();
    GameManager gm(cfg);
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "alice", { 500.0f, 500.0f }, 30);
    place(gm, 2, "bob", { 540.0f, 500.0f }, 10);

    SnapshotPtr snap = gm.tick(kDt, t0);
    ServerPlayer a = player(gm, 1);
    ServerPlayer b = player(gm, 2);
    CHECK(a.score == 40);
    CHECK(a.radius == doctest::Approx(60.0f));
    CHECK_FALSE(b.alive);
    CHECK(gm.playerCount() == 2);
    CHECK(gm.alivePlayerCount() == 1);
    REQUIRE(snap);
    REQUIRE(snap->players.size() == 1);
    CHECK(snap->players[0].id == 1);

    // dead players ignore movement
    CHECK_FALSE(gm.recordMoveIntent(2, 1.0f, 0.0f, 1));

    gm.tick(kDt, t0 + 1s);
    CHECK_FALSE(player(gm, 2).alive);

    gm.tick(kDt, t0 + 3s);
    b = player(gm, 2);
    a = player(gm, 1);
    CHECK(b.alive);
    CHECK(b.score == 0);
    CHECK(b.radius == doctest::Approx(cfg.player.startRadius));
    CHECK(glm::distance(a.position, b.position) >= cfg.game.minSpawnDistance);
}

TEST_CASE("size ratio must be met to eat") {
    GameManager gm(makeTestConfig());
    place(gm, 1, "alice", { 500.0f, 500.0f }, 10); // r 30
    place(gm, 2, "bob", { 520.0f, 500.0f }, 7);    // r 27

    gm.tick(kDt, Clock::now());
    CHECK(player(gm, 1).alive);
    CHECK(player(gm, 2).alive);
    CHECK(player(gm, 1).score == 10);
}

TEST_CASE("equal-size eaters: lowest id wins") {
    GameManager gm(makeTestConfig());
    place(gm, 10, "victim", { 500.0f, 500.0f }, 0);
    place(gm, 5, "east", { 560.0f, 500.0f }, 20);
    place(gm, 3, "west", { 440.0f, 500.0f }, 20);

    gm.tick(kDt, Clock::now());
    CHECK_FALSE(player(gm, 10).alive);
    CHECK(player(gm, 3).score == 30);
    CHECK(player(gm, 5).score == 20);
}

TEST_CASE("eat reward uses the configured fraction and minimum") {
    ServerConfig cfg = makeTestConfig();
    cfg.game.eatRewardFraction = 0.5f;
    cfg.game.eatRewardMinimum = 4;
    GameManager gm(cfg);
    place(gm, 1, "big", { 500.0f, 500.0f }, 200);
    place(gm, 2, "small", { 600.0f, 500.0f }, 50);

    gm.tick(kDt, Clock::now());
    CHECK_FALSE(player(gm, 2).alive);
    CHECK(player(gm, 1).score == 225);
}

TEST_CASE("push moves smaller targets away") {
    GameManager gm(makeTestConfig());
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "caster", { 500.0f, 500.0f }, 0); // r 20, push reach 90
    place(gm, 2, "target", { 560.0f, 500.0f }, 5); // r 25
    gm.clearFood();
    gm.spawnFoodAt({ 500.0f, 550.0f }, 1);

    REQUIRE(gm.activateSkill(1, "push", t0));
    CHECK_FALSE(gm.activateSkill(1, "push", t0 + 1s));
    SnapshotPtr snap = gm.tick(kDt, t0);

    CHECK(player(gm, 2).position.x == doctest::Approx(580.0f));
    CHECK(player(gm, 1).position.x == doctest::Approx(500.0f));
    const std::vector<Food> food = gm.getFoodCopy();
    REQUIRE(food.size() == 1);
    CHECK(food[0].position.y == doctest::Approx(550.0f + 600.0f * (1.0f - 50.0f / 90.0f) * kDt));

    REQUIRE(snap);
    for (const PlayerView& v : snap->players) {
        if (v.id != 1) continue;
        CHECK(v.push.active);
        CHECK(v.push.radius == doctest::Approx(90.0f));
        CHECK_FALSE(v.pull.active);
        CHECK(v.pull.radius == 0.0f);
    }
}

TEST_CASE("push against an oversized target moves the caster") {
    GameManager gm(makeTestConfig());
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "caster", { 500.0f, 500.0f }, 0);  // r 20
    place(gm, 2, "target", { 580.0f, 500.0f }, 20); // r 40 > 1.5 * 20

    REQUIRE(gm.activateSkill(1, "push", t0));
    gm.tick(kDt, t0);

    CHECK(player(gm, 1).position.x == doctest::Approx(500.0f - 600.0f * (1.0f - 80.0f / 90.0f) * kDt));
    CHECK(player(gm, 2).position.x == doctest::Approx(580.0f));
}

TEST_CASE("pull draws targets in but never past the caster") {
    GameManager gm(makeTestConfig());
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "caster", { 500.0f, 500.0f }, 0); // r 20, pull reach 110
    place(gm, 2, "near", { 560.0f, 500.0f }, 0);   // r 20
    place(gm, 3, "touch", { 500.0f, 501.0f }, 0);  // r 20, 1 unit away
    place(gm, 4, "heavy", { 500.0f, 420.0f }, 1);  // r 21 > 1.0 * 20

    REQUIRE(gm.activateSkill(1, "pull", t0));
    gm.tick(kDt, t0);

    CHECK(player(gm, 2).position.x == doctest::Approx(560.0f - 400.0f * (1.0f - 60.0f / 110.0f) * kDt));
    CHECK(player(gm, 3).position.y == doctest::Approx(500.0f));
    CHECK(player(gm, 4).position.y == doctest::Approx(420.0f));
}

TEST_CASE("skills expire and respect cooldown") {
    GameManager gm(makeTestConfig());
    const Clock::time_point t0 = Clock::now();
    place(gm, 1, "caster", { 500.0f, 500.0f }, 0);

    CHECK_FALSE(gm.activateSkill(1, "dash", t0));
    CHECK_FALSE(gm.activateSkill(42, "push", t0));
    REQUIRE(gm.activateSkill(1, "push", t0));
    gm.tick(kDt, t0 + 600ms);
    CHECK_FALSE(player(gm, 1).push.isActive());
    CHECK_FALSE(gm.activateSkill(1, "push", t0 + 4s));
    CHECK(gm.activateSkill(1, "push", t0 + 5s));
    // independent cooldowns
    CHECK(gm.activateSkill(1, "pull", t0 + 1s));
}

TEST_CASE("food count stays within bounds") {
    ServerConfig cfg = makeTestConfig();
    cfg.food.minCount = 5;
    cfg.food.maxCount = 20;
    cfg.food.spawnRate = 100.0f;
    GameManager gm(cfg);
    CHECK(gm.foodCount() == 5);

    place(gm, 1, "hungry", { 1000.0f, 1000.0f }, 300);
    const Clock::time_point t0 = Clock::now();
    for (int i = 0; i < 50; ++i) {
        if (i % 10 == 0) {
            // drop a cluster right on the player
            for (int k = 0; k < 10; ++k) gm.spawnFoodAt({ 1000.0f + k, 1000.0f });
        }
        REQUIRE(gm.recordMoveIntent(1, (i % 2) ? 1.0f : -1.0f, 0.5f, static_cast<uint64_t>(i + 1)));
        gm.tick(kDt, t0 + std::chrono::milliseconds(100 * i));
        CHECK(gm.foodCount() >= cfg.food.minCount);
        CHECK(gm.foodCount() <= cfg.food.maxCount);
    }
    CHECK(player(gm, 1).score > 300);
}

TEST_CASE("empty world refills to the maximum over time") {
    ServerConfig cfg = makeTestConfig();
    cfg.food.minCount = 2;
    cfg.food.maxCount = 12;
    cfg.food.spawnRate = 30.0f;
    GameManager gm(cfg);
    const Clock::time_point t0 = Clock::now();

    gm.tick(kDt, t0);
    CHECK(gm.foodCount() == 5);
    for (int i = 0; i < 10; ++i) gm.tick(kDt, t0);
    CHECK(gm.foodCount() == 12);
    for (const Food& f : gm.getFoodCopy()) {
        CHECK(f.value == cfg.food.value);
        CHECK(f.position.x >= f.radius);
        CHECK(f.position.x <= cfg.world.width - f.radius);
    }
}

TEST_CASE("snapshots advance with the tick") {
    GameManager gm(makeTestConfig());
    SnapshotPtr initial = gm.latestSnapshot();
    REQUIRE(initial);
    CHECK(initial->tick == 0);
    CHECK(initial->players.empty());

    place(gm, 1, "alice", { 500.0f, 500.0f }, 5);
    SnapshotPtr next = gm.tick(kDt, Clock::now());
    REQUIRE(next);
    CHECK(next->tick == 1);
    CHECK(gm.currentTick() == 1);
    CHECK(gm.latestSnapshot() == next);
    REQUIRE(next->players.size() == 1);
    CHECK(next->players[0].name == "alice");
    CHECK(next->players[0].score == 5);
    CHECK_FALSE(next->players[0].health.has_value());
    // the earlier snapshot is untouched
    CHECK(initial->tick == 0);
}

TEST_CASE("tick hook runs for alive players only") {
    GameManager gm(makeTestConfig());
    place(gm, 1, "alice", { 500.0f, 500.0f }, 30);
    place(gm, 2, "bob", { 540.0f, 500.0f }, 10);

    std::vector<PlayerID> seen;
    gm.setPlayerTickHook([&seen](ServerPlayer& p, float dt) {
        CHECK(dt == doctest::Approx(kDt));
        seen.push_back(p.id);
    });
    gm.tick(kDt, Clock::now());
    CHECK(seen == std::vector<PlayerID>{ 1 });
}

TEST_CASE("spawn points keep away from alive players when possible") {
    ServerConfig cfg = makeTestConfig();
    cfg.game.minSpawnDistance = 300.0f;
    GameManager gm(cfg);
    place(gm, 1, "alice", { 1000.0f, 1000.0f }, 0);
    for (int i = 0; i < 20; ++i) {
        const glm::vec2 p = gm.findSpawnPoint();
        CHECK(glm::distance(p, glm::vec2(1000.0f, 1000.0f)) >= 300.0f);
    }
}

} // TEST_SUITE("game_manager")

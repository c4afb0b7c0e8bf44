#pragma once
#include "GameState.hpp"
#include "../config/ServerConfig.hpp"
#include "../physics/SpatialGrid.hpp"
#include "../player/ServerPlayer.hpp"
#include "../../Shared/entities/Food.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>
#include <glm/vec2.hpp>

enum class JoinResult : uint8_t {
    Joined = 0,
    InvalidName,
    NameTaken,
    ServerFull,
};

struct JoinOutcome {
    JoinResult result = JoinResult::InvalidName;
    glm::vec2 spawnPosition{ 0.0f };
};

constexpr size_t kMinNameLength = 3;
constexpr size_t kMaxNameLength = 20;

// 3..20 characters from [A-Za-z0-9_-]
bool isValidPlayerName(std::string_view name) noexcept;

// Authoritative world: players, food and the per-tick transition.
// Every public method is safe to call from any thread; one recursive mutex
// guards the world and the tick holds it for the whole step.
class GameManager {
public:
    // runs once per tick for every alive player, after collisions and respawns
    using PlayerTickHook = std::function<void(ServerPlayer& player, float dt)>;

    // Throws ConfigError for an invalid configuration.
    explicit GameManager(const ServerConfig& config);
    ~GameManager() = default;

    GameManager(const GameManager&) = delete;
    GameManager& operator=(const GameManager&) = delete;

    // Capacity, validity and uniqueness are checked atomically with the insert.
    JoinOutcome addPlayer(PlayerID id, const std::string& name);

    // false if unknown
    bool removePlayer(PlayerID id);

    // Stores the latest movement direction. Returns false for an unknown or
    // dead player or a stale sequence (<= last applied once a move was seen).
    bool recordMoveIntent(PlayerID id, float dx, float dy, uint64_t sequence);

    // false for an unknown player, unknown skill, a dead player or a skill
    // still cooling down
    bool activateSkill(PlayerID id, std::string_view skillName, Clock::time_point now);

    // One simulation step; returns the freshly published snapshot.
    SnapshotPtr tick(float dt, Clock::time_point now);

    [[nodiscard]] SnapshotPtr latestSnapshot() const;

    // Free names derived from `name`, each valid and not in use.
    std::vector<std::string> suggestNames(const std::string& name, size_t count = 3);

    // connected players, dead ones included
    [[nodiscard]] size_t playerCount() const;
    [[nodiscard]] size_t alivePlayerCount() const;
    [[nodiscard]] size_t foodCount() const;
    [[nodiscard]] uint64_t currentTick() const;

    std::optional<ServerPlayer> getPlayerCopy(PlayerID id) const;
    std::vector<Food> getFoodCopy() const;

    // Administrative placement. Position is clamped into the world; a score,
    // when given, replaces the current one and the radius follows it.
    bool applyAuthoritativeState(PlayerID id, glm::vec2 position, std::optional<uint64_t> score = std::nullopt);
    FoodID spawnFoodAt(glm::vec2 position, std::optional<uint32_t> value = std::nullopt);
    void clearFood();

    void setPlayerTickHook(PlayerTickHook hook);

    [[nodiscard]] float radiusForScore(uint64_t score) const noexcept;
    [[nodiscard]] float speedForRadius(float radius) const noexcept;

    // Random point at least game.min_spawn_distance from every alive player,
    // or the least crowded of game.spawn_attempts candidates.
    glm::vec2 findSpawnPoint();

    [[nodiscard]] const ServerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] WorldBounds bounds() const noexcept { return m_bounds; }

private:
    void applyIntents(float dt);
    void resolveSkills(float dt, Clock::time_point now);
    void applySkill(ServerPlayer& caster, const SkillState& skill, float dt);
    void resolveFoodCollisions();
    void resolvePlayerCollisions(std::vector<PlayerID>& eaten);
    void handleDeathsAndRespawns(const std::vector<PlayerID>& eaten, Clock::time_point now);
    void replenishFood(float dt);
    void runPlayerHooks(float dt);
    SnapshotPtr publishSnapshot();

    void rebuildFoodGrid();
    Food& spawnFoodLocked(glm::vec2 position, uint32_t value);
    glm::vec2 randomFoodPosition();
    glm::vec2 randomPoint(float radius);
    float nearestAlivePlayerDistance(glm::vec2 p) const;
    bool nameInUse(std::string_view name) const;
    void resetForRespawn(ServerPlayer& p);

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
        return items[dist(m_rng)];
    }

    const ServerConfig m_config;
    const WorldBounds m_bounds;

    mutable std::recursive_mutex m_mutex;

    // ordered by id: every per-tick pass visits players in ascending id
    std::map<PlayerID, ServerPlayer> m_players;
    std::vector<Food> m_food;
    FoodID m_nextFoodId{ 1 };
    float m_foodSpawnCredit = 0.0f;
    SpatialGrid m_foodGrid;
    std::mt19937_64 m_rng;
    uint64_t m_tick = 0;
    PlayerTickHook m_playerTickHook;

    mutable std::mutex m_snapshotMutex;
    SnapshotPtr m_snapshot;
};

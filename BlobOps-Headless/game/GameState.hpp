#pragma once
#include "../../Shared/entities/Food.hpp"
#include "../player/ServerPlayer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <glm/vec2.hpp>

struct SkillView {
    bool active = false;
    float radius = 0.0f; // effective radius while active, 0 otherwise
};

struct PlayerView {
    PlayerID id = 0;
    std::string name;
    glm::vec2 position{ 0.0f };
    float radius = 0.0f;
    uint64_t score = 0;
    Color color{ 255, 255, 255 };
    SkillView push;
    SkillView pull;
    std::optional<float> health;
};

struct FoodView {
    FoodID id = 0;
    glm::vec2 position{ 0.0f };
    float radius = 0.0f;
    uint32_t value = 0;
    Color color{ 255, 255, 255 };
};

// Immutable copy of the world published once per tick. Only alive players
// appear; ordered by ascending id.
struct GameStateSnapshot {
    std::vector<PlayerView> players;
    std::vector<FoodView> food;
    uint64_t tick = 0;
    double timestamp = 0.0; // wall clock, seconds since epoch
};

using SnapshotPtr = std::shared_ptr<const GameStateSnapshot>;

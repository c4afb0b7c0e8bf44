#pragma once
#include "../../Shared/entities/Entity.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML { class Node; }

// Invalid or unreadable configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct WorldConfig {
    float width = 4000.0f;
    float height = 4000.0f;
};

struct PlayerConfig {
    float startRadius = 20.0f;
    float maxRadius = 400.0f;
    float growthFactor = 1.0f;
    float growthExponent = 1.0f;
    // world units per second at startRadius; falls off as (startRadius / radius)^speedFalloff
    float baseSpeed = 240.0f;
    float minSpeed = 60.0f;
    float speedFalloff = 0.5f;
    std::vector<Color> colors{
        { 230, 25, 75 }, { 60, 180, 75 }, { 255, 225, 25 }, { 0, 130, 200 },
        { 245, 130, 48 }, { 145, 30, 180 }, { 70, 240, 240 }, { 240, 50, 230 }
    };
};

struct FoodConfig {
    float radius = 5.0f;
    uint32_t value = 1;
    size_t minCount = 200;
    size_t maxCount = 400;
    float spawnRate = 20.0f;          // items per second above minCount
    float minPlayerDistance = 0.0f;   // 0 disables the check
    float gridCellSize = 128.0f;
    std::vector<Color> colors{
        { 255, 99, 71 }, { 124, 252, 0 }, { 30, 144, 255 }, { 255, 215, 0 }, { 238, 130, 238 }
    };
};

struct SkillConfig {
    uint32_t level = 1;
    float baseRadius = 60.0f;
    float radiusPerLevel = 10.0f;
    float force = 600.0f;       // displacement per second at zero distance
    float duration = 0.5f;      // seconds
    float cooldown = 5.0f;      // seconds, measured from activation
    float sizeThresholdMultiplier = 1.5f;
};

struct SkillsConfig {
    SkillConfig push{ 1, 60.0f, 10.0f, 600.0f, 0.5f, 5.0f, 1.5f };
    SkillConfig pull{ 1, 80.0f, 10.0f, 400.0f, 0.75f, 6.0f, 1.0f };
};

struct GameRulesConfig {
    float tickRate = 30.0f;
    size_t maxPlayers = 50;
    float eatRatio = 1.2f;
    float eatRewardFraction = 1.0f;   // share of the victim's score granted to the eater
    uint32_t eatRewardMinimum = 10;
    float respawnCooldown = 3.0f;     // seconds
    float minSpawnDistance = 150.0f;
    uint32_t spawnAttempts = 30;
    uint64_t randomSeed = 0;          // 0 = seed from std::random_device
};

struct RateLimitConfig {
    size_t maxAttempts = 5;
    float window = 60.0f;             // seconds
};

struct NetworkConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5555;
    size_t maxConnections = 64;
    uint32_t maxMessageSize = 64 * 1024;
    float handshakeTimeout = 10.0f;   // seconds to receive a valid connect
    float clientTimeout = 30.0f;      // keepalive window once active
    size_t maxOutboundFrames = 32;
    uint32_t protocolVersion = 1;
    float statusLogInterval = 30.0f;  // 0 disables the periodic status line
    std::string serverFullMessage = "Server is full";
    std::string usernameTakenMessage = "Username is already taken";
    std::string rateLimitedMessage = "Too many connection attempts, try again later";
    RateLimitConfig rateLimit;
};

struct SurvivalConfig {
    bool enabled = false;
    float maxHealth = 100.0f;
    float maxCalories = 3000.0f;
    float maxHydration = 5000.0f;
    float maxBlood = 5000.0f;
    float caloriesDrainIdle = 1.0f;   // per second
    float hydrationDrainIdle = 1.5f;
    float moveMult = 1.5f;
    float sprintMult = 2.0f;
    float craftingMult = 1.2f;
    float starveHpLoss = 0.5f;
    float dehydrateHpLoss = 1.0f;
    float bleedLossPerSec = 10.0f;
    float lowBloodThreshold = 3000.0f;
    float lowBloodHpLoss = 0.5f;
    float infectionHpLoss = 0.2f;
    float hypothermiaTemp = 35.0f;    // Celsius
    float hypothermiaHpLoss = 0.5f;
    float heatstrokeTemp = 40.0f;
    float heatstrokeHydrationDrain = 2.0f;
};

struct ServerConfig {
    WorldConfig world;
    PlayerConfig player;
    FoodConfig food;
    SkillsConfig skills;
    GameRulesConfig game;
    NetworkConfig network;
    SurvivalConfig survival;
};

// Every key is optional and overrides the compiled-in default. Wrong types,
// malformed YAML or values rejected by validateServerConfig throw ConfigError.
ServerConfig loadServerConfig(const std::string& path);
ServerConfig parseServerConfigText(const std::string& yamlText);
ServerConfig parseServerConfigNode(const YAML::Node& root);

void validateServerConfig(const ServerConfig& config);

inline WorldBounds worldBounds(const WorldConfig& world) noexcept {
    return WorldBounds{ world.width, world.height };
}

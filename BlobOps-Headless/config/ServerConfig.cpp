#include "ServerConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>

namespace {

    template <typename T>
    void readKey(const YAML::Node& section, const char* key, T& out) {
        if (const YAML::Node value = section[key]) {
            out = value.as<T>();
        }
    }

    // Returns an undefined node when the section is absent; throws when it is
    // present but not a mapping.
    YAML::Node mapSection(const YAML::Node& parent, const char* key, const std::string& path) {
        YAML::Node section = parent[key];
        if (section && !section.IsMap()) {
            throw ConfigError("config: '" + path + "' must be a mapping");
        }
        return section;
    }

    void readColors(const YAML::Node& section, const char* key, std::vector<Color>& out) {
        const YAML::Node list = section[key];
        if (!list) return;
        if (!list.IsSequence()) {
            throw ConfigError(std::string("config: '") + key + "' must be a list of [r, g, b]");
        }
        std::vector<Color> colors;
        colors.reserve(list.size());
        for (const YAML::Node& entry : list) {
            if (!entry.IsSequence() || entry.size() != 3) {
                throw ConfigError(std::string("config: '") + key + "' entries must have three components");
            }
            Color c{};
            for (size_t i = 0; i < 3; ++i) {
                const int component = entry[i].as<int>();
                if (component < 0 || component > 255) {
                    throw ConfigError(std::string("config: '") + key + "' component out of range 0..255");
                }
                c[i] = static_cast<uint8_t>(component);
            }
            colors.push_back(c);
        }
        out = std::move(colors);
    }

    void readSkill(const YAML::Node& skills, const char* key, SkillConfig& out) {
        const YAML::Node s = mapSection(skills, key, std::string("skills.") + key);
        if (!s) return;
        readKey(s, "level", out.level);
        readKey(s, "base_radius", out.baseRadius);
        readKey(s, "radius_per_level", out.radiusPerLevel);
        readKey(s, "force", out.force);
        readKey(s, "duration", out.duration);
        readKey(s, "cooldown", out.cooldown);
        readKey(s, "size_threshold_multiplier", out.sizeThresholdMultiplier);
    }

    void require(bool condition, const char* message) {
        if (!condition) throw ConfigError(std::string("config: ") + message);
    }

    bool finiteNonNegative(float v) { return std::isfinite(v) && v >= 0.0f; }
    bool finitePositive(float v) { return std::isfinite(v) && v > 0.0f; }

    void validateSkill(const SkillConfig& s, const char* name) {
        const std::string prefix = std::string("skills.") + name + ".";
        if (!finiteNonNegative(s.baseRadius)) throw ConfigError("config: " + prefix + "base_radius must be >= 0");
        if (!finiteNonNegative(s.radiusPerLevel)) throw ConfigError("config: " + prefix + "radius_per_level must be >= 0");
        if (!finiteNonNegative(s.force)) throw ConfigError("config: " + prefix + "force must be >= 0");
        if (!finiteNonNegative(s.duration)) throw ConfigError("config: " + prefix + "duration must be >= 0");
        if (!finiteNonNegative(s.cooldown)) throw ConfigError("config: " + prefix + "cooldown must be >= 0");
        if (!finitePositive(s.sizeThresholdMultiplier)) {
            throw ConfigError("config: " + prefix + "size_threshold_multiplier must be > 0");
        }
    }

} // namespace


ServerConfig loadServerConfig(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError("config: cannot load '" + path + "': " + e.what());
    }
    return parseServerConfigNode(root);
}

ServerConfig parseServerConfigText(const std::string& yamlText)
{
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    }
    catch (const YAML::Exception& e) {
        throw ConfigError(std::string("config: malformed YAML: ") + e.what());
    }
    return parseServerConfigNode(root);
}

ServerConfig parseServerConfigNode(const YAML::Node& root)
{
    ServerConfig cfg;
    if (!root || root.IsNull()) {
        validateServerConfig(cfg);
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("config: top level must be a mapping");
    }

    try {
        if (const YAML::Node world = mapSection(root, "world", "world")) {
            readKey(world, "width", cfg.world.width);
            readKey(world, "height", cfg.world.height);
        }

        if (const YAML::Node player = mapSection(root, "player", "player")) {
            readKey(player, "start_radius", cfg.player.startRadius);
            readKey(player, "max_radius", cfg.player.maxRadius);
            readKey(player, "growth_factor", cfg.player.growthFactor);
            readKey(player, "growth_exponent", cfg.player.growthExponent);
            readKey(player, "base_speed", cfg.player.baseSpeed);
            readKey(player, "min_speed", cfg.player.minSpeed);
            readKey(player, "speed_falloff", cfg.player.speedFalloff);
            readColors(player, "colors", cfg.player.colors);
        }

        if (const YAML::Node food = mapSection(root, "food", "food")) {
            readKey(food, "radius", cfg.food.radius);
            readKey(food, "value", cfg.food.value);
            readKey(food, "min_count", cfg.food.minCount);
            readKey(food, "max_count", cfg.food.maxCount);
            readKey(food, "spawn_rate", cfg.food.spawnRate);
            readKey(food, "min_player_distance", cfg.food.minPlayerDistance);
            readKey(food, "grid_cell_size", cfg.food.gridCellSize);
            readColors(food, "colors", cfg.food.colors);
        }

        if (const YAML::Node skills = mapSection(root, "skills", "skills")) {
            readSkill(skills, "push", cfg.skills.push);
            readSkill(skills, "pull", cfg.skills.pull);
        }

        if (const YAML::Node game = mapSection(root, "game", "game")) {
            readKey(game, "tick_rate", cfg.game.tickRate);
            readKey(game, "max_players", cfg.game.maxPlayers);
            readKey(game, "eat_ratio", cfg.game.eatRatio);
            readKey(game, "eat_reward_fraction", cfg.game.eatRewardFraction);
            readKey(game, "eat_reward_minimum", cfg.game.eatRewardMinimum);
            readKey(game, "respawn_cooldown", cfg.game.respawnCooldown);
            readKey(game, "min_spawn_distance", cfg.game.minSpawnDistance);
            readKey(game, "spawn_attempts", cfg.game.spawnAttempts);
            readKey(game, "random_seed", cfg.game.randomSeed);
        }

        if (const YAML::Node net = mapSection(root, "network", "network")) {
            readKey(net, "host", cfg.network.host);
            readKey(net, "port", cfg.network.port);
            readKey(net, "max_connections", cfg.network.maxConnections);
            readKey(net, "max_message_size", cfg.network.maxMessageSize);
            readKey(net, "handshake_timeout", cfg.network.handshakeTimeout);
            readKey(net, "client_timeout", cfg.network.clientTimeout);
            readKey(net, "max_outbound_frames", cfg.network.maxOutboundFrames);
            readKey(net, "protocol_version", cfg.network.protocolVersion);
            readKey(net, "status_log_interval", cfg.network.statusLogInterval);
            readKey(net, "server_full_message", cfg.network.serverFullMessage);
            readKey(net, "username_taken_message", cfg.network.usernameTakenMessage);
            readKey(net, "rate_limited_message", cfg.network.rateLimitedMessage);
            if (const YAML::Node rl = mapSection(net, "rate_limit", "network.rate_limit")) {
                readKey(rl, "max_attempts", cfg.network.rateLimit.maxAttempts);
                readKey(rl, "window", cfg.network.rateLimit.window);
            }
        }

        if (const YAML::Node s = mapSection(root, "survival", "survival")) {
            SurvivalConfig& sv = cfg.survival;
            readKey(s, "enabled", sv.enabled);
            readKey(s, "max_health", sv.maxHealth);
            readKey(s, "max_calories", sv.maxCalories);
            readKey(s, "max_hydration", sv.maxHydration);
            readKey(s, "max_blood", sv.maxBlood);
            readKey(s, "calories_drain_idle", sv.caloriesDrainIdle);
            readKey(s, "hydration_drain_idle", sv.hydrationDrainIdle);
            readKey(s, "move_mult", sv.moveMult);
            readKey(s, "sprint_mult", sv.sprintMult);
            readKey(s, "crafting_mult", sv.craftingMult);
            readKey(s, "starve_hp_loss", sv.starveHpLoss);
            readKey(s, "dehydrate_hp_loss", sv.dehydrateHpLoss);
            readKey(s, "bleed_loss_per_sec", sv.bleedLossPerSec);
            readKey(s, "low_blood_threshold", sv.lowBloodThreshold);
            readKey(s, "low_blood_hp_loss", sv.lowBloodHpLoss);
            readKey(s, "infection_hp_loss", sv.infectionHpLoss);
            readKey(s, "hypothermia_temp", sv.hypothermiaTemp);
            readKey(s, "hypothermia_hp_loss", sv.hypothermiaHpLoss);
            readKey(s, "heatstroke_temp", sv.heatstrokeTemp);
            readKey(s, "heatstroke_hydration_drain", sv.heatstrokeHydrationDrain);
        }
    }
    catch (const YAML::Exception& e) {
        std::ostringstream oss;
        oss << "config: bad value at line " << (e.mark.line + 1) << ": " << e.msg;
        throw ConfigError(oss.str());
    }

    validateServerConfig(cfg);
    return cfg;
}

void validateServerConfig(const ServerConfig& config)
{
    require(worldBounds(config.world).isValid(), "world.width and world.height must be > 0");

    const PlayerConfig& p = config.player;
    require(finitePositive(p.startRadius), "player.start_radius must be > 0");
    require(std::isfinite(p.maxRadius) && p.maxRadius >= p.startRadius, "player.max_radius must be >= start_radius");
    require(finiteNonNegative(p.growthFactor), "player.growth_factor must be >= 0");
    require(finitePositive(p.growthExponent), "player.growth_exponent must be > 0");
    require(finiteNonNegative(p.baseSpeed), "player.base_speed must be >= 0");
    require(finiteNonNegative(p.minSpeed), "player.min_speed must be >= 0");
    require(finiteNonNegative(p.speedFalloff), "player.speed_falloff must be >= 0");
    require(!p.colors.empty(), "player.colors must not be empty");

    const FoodConfig& f = config.food;
    require(finitePositive(f.radius), "food.radius must be > 0");
    require(f.minCount <= f.maxCount, "food.min_count must be <= food.max_count");
    require(finiteNonNegative(f.spawnRate), "food.spawn_rate must be >= 0");
    require(finiteNonNegative(f.minPlayerDistance), "food.min_player_distance must be >= 0");
    require(finitePositive(f.gridCellSize), "food.grid_cell_size must be > 0");
    require(!f.colors.empty(), "food.colors must not be empty");

    validateSkill(config.skills.push, "push");
    validateSkill(config.skills.pull, "pull");

    const GameRulesConfig& g = config.game;
    require(finitePositive(g.tickRate) && g.tickRate <= 1000.0f, "game.tick_rate must be in (0, 1000]");
    require(g.maxPlayers >= 1, "game.max_players must be >= 1");
    require(std::isfinite(g.eatRatio) && g.eatRatio >= 1.0f, "game.eat_ratio must be >= 1");
    require(finiteNonNegative(g.eatRewardFraction), "game.eat_reward_fraction must be >= 0");
    require(finiteNonNegative(g.respawnCooldown), "game.respawn_cooldown must be >= 0");
    require(finiteNonNegative(g.minSpawnDistance), "game.min_spawn_distance must be >= 0");
    require(g.spawnAttempts >= 1, "game.spawn_attempts must be >= 1");

    const NetworkConfig& n = config.network;
    require(!n.host.empty(), "network.host must not be empty");
    require(n.maxConnections >= 1, "network.max_connections must be >= 1");
    require(n.maxMessageSize >= 64, "network.max_message_size must be >= 64");
    require(finitePositive(n.handshakeTimeout), "network.handshake_timeout must be > 0");
    require(finitePositive(n.clientTimeout), "network.client_timeout must be > 0");
    require(n.maxOutboundFrames >= 1, "network.max_outbound_frames must be >= 1");
    require(finiteNonNegative(n.statusLogInterval), "network.status_log_interval must be >= 0");
    require(n.rateLimit.maxAttempts >= 1, "network.rate_limit.max_attempts must be >= 1");
    require(finitePositive(n.rateLimit.window), "network.rate_limit.window must be > 0");

    const SurvivalConfig& s = config.survival;
    require(finitePositive(s.maxHealth) && finitePositive(s.maxCalories)
        && finitePositive(s.maxHydration) && finitePositive(s.maxBlood),
        "survival maxima must be > 0");
}

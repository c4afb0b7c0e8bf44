#pragma once
#include "../config/ServerConfig.hpp"

struct SurvivalStats {
    float health = 100.0f;
    float calories = 3000.0f;
    float hydration = 5000.0f;
    float blood = 5000.0f;
    bool bleeding = false;
    bool infection = false;
    float temperature = 37.0f; // Celsius

    // every gauge into [0, configured maximum]
    void clamp(const SurvivalConfig& cfg) noexcept;
};

// what the player did since the last update
struct SurvivalActivity {
    bool moving = false;
    bool sprinting = false;
    bool crafting = false;
};

// Server-authoritative hunger / thirst / blood / health model. Runs as a
// periodic hook; it never touches movement or kills a player on its own.
class SurvivalSystem {
public:
    explicit SurvivalSystem(const SurvivalConfig& config);

    // Fresh stats filled to the configured maxima.
    [[nodiscard]] SurvivalStats initialStats() const noexcept;

    void update(SurvivalStats& stats, float dt, const SurvivalActivity& activity = {}) const;

    void eat(SurvivalStats& stats, float kcal) const;
    void drink(SurvivalStats& stats, float amount) const;
    void takeDamage(SurvivalStats& stats, float hp) const;
    void setBleeding(SurvivalStats& stats, bool on = true) const noexcept { stats.bleeding = on; }
    void bandage(SurvivalStats& stats) const noexcept { stats.bleeding = false; }
    void transfuse(SurvivalStats& stats, float amount) const;
    void setInfection(SurvivalStats& stats, bool on = true) const noexcept { stats.infection = on; }
    void setTemperature(SurvivalStats& stats, float celsius) const noexcept { stats.temperature = celsius; }

    [[nodiscard]] const SurvivalConfig& config() const noexcept { return m_config; }

private:
    SurvivalConfig m_config;
};

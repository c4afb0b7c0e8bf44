#include "SurvivalSystem.hpp"
#include <algorithm>
#include <cmath>

namespace {
    float clampGauge(float v, float maxValue) {
        if (!std::isfinite(v)) return 0.0f;
        return std::clamp(v, 0.0f, maxValue);
    }

    float nonNegative(float v) {
        return (std::isfinite(v) && v > 0.0f) ? v : 0.0f;
    }
}

void SurvivalStats::clamp(const SurvivalConfig& cfg) noexcept {
    health = clampGauge(health, cfg.maxHealth);
    calories = clampGauge(calories, cfg.maxCalories);
    hydration = clampGauge(hydration, cfg.maxHydration);
    blood = clampGauge(blood, cfg.maxBlood);
}

SurvivalSystem::SurvivalSystem(const SurvivalConfig& config)
    : m_config(config)
{
}

SurvivalStats SurvivalSystem::initialStats() const noexcept {
    SurvivalStats s;
    s.health = m_config.maxHealth;
    s.calories = m_config.maxCalories;
    s.hydration = m_config.maxHydration;
    s.blood = m_config.maxBlood;
    return s;
}

void SurvivalSystem::update(SurvivalStats& stats, float dt, const SurvivalActivity& activity) const {
    const SurvivalConfig& c = m_config;
    if (!(dt > 0.0f)) return;

    float mult = 1.0f;
    if (activity.moving) mult *= c.moveMult;
    if (activity.sprinting) mult *= c.sprintMult;
    if (activity.crafting) mult *= c.craftingMult;

    stats.calories -= c.caloriesDrainIdle * mult * dt;
    stats.hydration -= c.hydrationDrainIdle * mult * dt;

    if (stats.calories <= 0.0f) stats.health -= c.starveHpLoss * dt;
    if (stats.hydration <= 0.0f) stats.health -= c.dehydrateHpLoss * dt;

    if (stats.bleeding) stats.blood -= c.bleedLossPerSec * dt;
    if (stats.blood < c.lowBloodThreshold) stats.health -= c.lowBloodHpLoss * dt;

    if (stats.infection) stats.health -= c.infectionHpLoss * dt;

    if (stats.temperature < c.hypothermiaTemp) {
        stats.health -= c.hypothermiaHpLoss * dt;
    }
    else if (stats.temperature > c.heatstrokeTemp) {
        stats.hydration -= c.heatstrokeHydrationDrain * dt;
    }

    stats.clamp(c);
}

void SurvivalSystem::eat(SurvivalStats& stats, float kcal) const {
    stats.calories += nonNegative(kcal);
    stats.clamp(m_config);
}

void SurvivalSystem::drink(SurvivalStats& stats, float amount) const {
    stats.hydration += nonNegative(amount);
    stats.clamp(m_config);
}

void SurvivalSystem::takeDamage(SurvivalStats& stats, float hp) const {
    stats.health -= nonNegative(hp);
    stats.clamp(m_config);
}

void SurvivalSystem::transfuse(SurvivalStats& stats, float amount) const {
    stats.blood += nonNegative(amount);
    stats.clamp(m_config);
}

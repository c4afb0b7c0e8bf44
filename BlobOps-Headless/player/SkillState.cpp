#include "SkillState.hpp"
#include <algorithm>
#include <cmath>

const char* skillKindName(SkillKind kind) noexcept {
    switch (kind) {
    case SkillKind::Push: return "push";
    case SkillKind::Pull: return "pull";
    }
    return "unknown";
}

std::optional<SkillKind> skillKindFromName(std::string_view name) noexcept {
    if (name == "push") return SkillKind::Push;
    if (name == "pull") return SkillKind::Pull;
    return std::nullopt;
}

SkillState::SkillState(SkillKind kind, const SkillConfig& config)
    : m_kind(kind),
    m_config(config)
{
}

double SkillState::secondsSinceUse(Clock::time_point now) const {
    if (!m_lastUsed) return 0.0;
    return std::chrono::duration<double>(now - *m_lastUsed).count();
}

bool SkillState::activate(Clock::time_point now) {
    if (m_lastUsed && secondsSinceUse(now) < static_cast<double>(m_config.cooldown)) {
        return false;
    }
    m_active = true;
    m_lastUsed = now;
    return true;
}

bool SkillState::update(Clock::time_point now) {
    if (!m_active) return false;
    if (secondsSinceUse(now) >= static_cast<double>(m_config.duration)) {
        m_active = false;
        return true;
    }
    return false;
}

SkillPhase SkillState::phase(Clock::time_point now) const {
    if (m_active) return SkillPhase::Active;
    if (m_lastUsed && secondsSinceUse(now) < static_cast<double>(m_config.cooldown)) {
        return SkillPhase::Cooldown;
    }
    return SkillPhase::Ready;
}

void SkillState::reset() noexcept {
    m_active = false;
    m_lastUsed.reset();
}

float SkillState::effectiveRadius(float playerRadius) const noexcept {
    const float r = (std::isfinite(playerRadius) && playerRadius > 0.0f) ? playerRadius : 0.0f;
    return m_config.baseRadius + static_cast<float>(m_config.level) * m_config.radiusPerLevel + r;
}

float SkillState::proximityDisplacement(float distance, float playerRadius, float dt) const noexcept {
    const float eff = effectiveRadius(playerRadius);
    if (eff <= 0.0f || !std::isfinite(distance) || distance > eff) return 0.0f;
    const float d = std::max(1.0f, distance);
    const float scale = std::max(0.0f, 1.0f - d / eff);
    return m_config.force * scale * dt;
}

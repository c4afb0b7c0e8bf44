#pragma once
#include "../config/ServerConfig.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

using Clock = std::chrono::steady_clock;

enum class SkillKind : uint8_t {
    Push = 0,
    Pull,
};

enum class SkillPhase : uint8_t {
    Ready = 0,
    Active,
    Cooldown,
};

const char* skillKindName(SkillKind kind) noexcept;
// "push" / "pull"; anything else is nullopt
std::optional<SkillKind> skillKindFromName(std::string_view name) noexcept;


// Timed area skill owned by a player. Activation is gated by the cooldown,
// measured from the previous activation; an active skill expires once
// `duration` has elapsed since activation.
class SkillState {
public:
    SkillState() = default;
    SkillState(SkillKind kind, const SkillConfig& config);

    // false while cooling down; otherwise starts the skill at `now`
    bool activate(Clock::time_point now);

    // Expires the skill when its duration is over. Returns true if it was
    // active and has just expired.
    bool update(Clock::time_point now);

    [[nodiscard]] SkillPhase phase(Clock::time_point now) const;

    // Back to idle and ready, as after a respawn.
    void reset() noexcept;

    // base radius + level bonus + the caster's own radius
    [[nodiscard]] float effectiveRadius(float playerRadius) const noexcept;

    // Displacement this step for a target `distance` away from the caster:
    // force * (1 - d / effectiveRadius) * dt with d = max(1, distance).
    // Zero outside the effective radius.
    [[nodiscard]] float proximityDisplacement(float distance, float playerRadius, float dt) const noexcept;

    // Target too large to be moved by this skill.
    [[nodiscard]] bool exceedsSizeThreshold(float targetRadius, float playerRadius) const noexcept {
        return targetRadius > playerRadius * m_config.sizeThresholdMultiplier;
    }

    [[nodiscard]] SkillKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool isActive() const noexcept { return m_active; }
    [[nodiscard]] uint32_t level() const noexcept { return m_config.level; }
    [[nodiscard]] const SkillConfig& config() const noexcept { return m_config; }
    [[nodiscard]] std::optional<Clock::time_point> lastUsed() const noexcept { return m_lastUsed; }

    void setLevel(uint32_t level) noexcept { m_config.level = level; }

private:
    double secondsSinceUse(Clock::time_point now) const;

    SkillKind m_kind = SkillKind::Push;
    SkillConfig m_config;
    bool m_active = false;
    std::optional<Clock::time_point> m_lastUsed;
};

#pragma once
#include "../../Shared/entities/Entity.hpp"
#include "../survival/SurvivalSystem.hpp"
#include "SkillState.hpp"
#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <glm/vec2.hpp>

using PlayerID = uint64_t;

struct ServerPlayer : Entity {
    PlayerID id = 0;
    std::string name;
    uint64_t score = 0;
    bool alive = true;

    // highest applied move sequence; stale moves are dropped
    uint64_t lastMoveSequence = 0;
    bool hasMoved = false;

    // unit or zero vector, consumed by the next tick
    glm::vec2 pendingIntent{ 0.0f };
    // a non-zero intent was applied on the last tick
    bool moving = false;

    // valid while !alive
    Clock::time_point respawnAt{};

    SkillState push;
    SkillState pull;

    std::optional<SurvivalStats> survival;

    ServerPlayer() { kind = EntityKind::Player; }

    SkillState& skill(SkillKind k) noexcept { return k == SkillKind::Push ? push : pull; }
    const SkillState& skill(SkillKind k) const noexcept { return k == SkillKind::Push ? push : pull; }
};

#pragma once
#include <glm/vec2.hpp>
#include <glm/geometric.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

using Color = std::array<uint8_t, 3>;

enum class EntityKind : uint8_t {
    Player = 0,
    Food = 1,
};

// Common shape of everything that lives in the world. Plain data.
struct Entity {
    glm::vec2 position{ 0.0f };
    float radius = 1.0f;
    Color color{ 255, 255, 255 };
    EntityKind kind = EntityKind::Food;
};

inline float distance(const Entity& a, const Entity& b) noexcept {
    return glm::distance(a.position, b.position);
}

// touching counts as overlapping
inline bool overlaps(const Entity& a, const Entity& b) noexcept {
    return distance(a, b) <= a.radius + b.radius;
}

struct WorldBounds {
    float width = 0.0f;
    float height = 0.0f;

    bool isValid() const noexcept {
        return std::isfinite(width) && std::isfinite(height) && width > 0.0f && height > 0.0f;
    }

    glm::vec2 center() const noexcept { return { width * 0.5f, height * 0.5f }; }

    // Keeps a circle of the given radius inside [radius, dim - radius] on each
    // axis. An axis narrower than the circle pins it to the centre; a
    // non-finite coordinate is reset to the centre.
    glm::vec2 clamp(glm::vec2 p, float radius) const noexcept {
        const float r = (std::isfinite(radius) && radius > 0.0f) ? radius : 0.0f;
        return { clampAxis(p.x, r, width), clampAxis(p.y, r, height) };
    }

private:
    static float clampAxis(float v, float r, float dim) noexcept {
        if (!std::isfinite(v)) return dim * 0.5f;
        if (2.0f * r >= dim) return dim * 0.5f;
        return std::clamp(v, r, dim - r);
    }
};

#pragma once
#include <glm/vec2.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

// Uniform broad-phase grid over a bounded 2D world. Every entry sits in the
// single cell containing its centre; positions outside the world land in the
// nearest edge cell. Rebuilt from scratch each tick (clear + insert); cells
// keep their capacity across clear().
class SpatialGrid {
public:
    struct Entry {
        uint64_t id = 0;
        glm::vec2 position{ 0.0f };
        float radius = 0.0f;
    };

    SpatialGrid() = default;

    SpatialGrid(float worldWidth, float worldHeight, float cellSize)
        : m_cellSize(cellSize > 0.0f ? cellSize : 1.0f),
        m_cols(std::max(1, static_cast<int>(std::ceil(worldWidth / m_cellSize)))),
        m_rows(std::max(1, static_cast<int>(std::ceil(worldHeight / m_cellSize)))),
        m_cells(static_cast<size_t>(m_cols) * static_cast<size_t>(m_rows))
    {
    }

    void clear() {
        for (auto& c : m_cells) c.clear();
        m_maxRadius = 0.0f;
        m_size = 0;
    }

    void insert(uint64_t id, glm::vec2 position, float radius) {
        m_cells[cellIndex(position)].push_back(Entry{ id, position, radius });
        m_maxRadius = std::max(m_maxRadius, radius);
        ++m_size;
    }

    // fn(const Entry&) for every entry whose centre is within `radius` of `centre`.
    template <typename F>
    void queryWithin(glm::vec2 centre, float radius, F&& fn) const {
        const float r2 = radius * radius;
        forEachCandidate(centre, radius, [&](const Entry& e) {
            const float dx = e.position.x - centre.x;
            const float dy = e.position.y - centre.y;
            if (dx * dx + dy * dy <= r2) fn(e);
        });
    }

    // fn(const Entry&) for every entry whose circle touches the circle
    // (centre, radius): distance <= radius + entry.radius.
    template <typename F>
    void queryOverlapping(glm::vec2 centre, float radius, F&& fn) const {
        forEachCandidate(centre, radius + m_maxRadius, [&](const Entry& e) {
            const float dx = e.position.x - centre.x;
            const float dy = e.position.y - centre.y;
            const float reach = radius + e.radius;
            if (dx * dx + dy * dy <= reach * reach) fn(e);
        });
    }

    [[nodiscard]] size_t size() const noexcept { return m_size; }
    [[nodiscard]] int columns() const noexcept { return m_cols; }
    [[nodiscard]] int rows() const noexcept { return m_rows; }

private:
    int cellCoord(float v, int count) const {
        if (!std::isfinite(v)) return 0;
        const float c = std::floor(v / m_cellSize);
        if (c < 0.0f) return 0;
        if (c >= static_cast<float>(count - 1)) return count - 1;
        return static_cast<int>(c);
    }

    size_t cellIndex(glm::vec2 p) const {
        return static_cast<size_t>(cellCoord(p.y, m_rows)) * static_cast<size_t>(m_cols)
            + static_cast<size_t>(cellCoord(p.x, m_cols));
    }

    template <typename F>
    void forEachCandidate(glm::vec2 centre, float reach, F&& fn) const {
        if (m_size == 0 || !std::isfinite(reach) || reach < 0.0f) return;
        const int x0 = cellCoord(centre.x - reach, m_cols);
        const int x1 = cellCoord(centre.x + reach, m_cols);
        const int y0 = cellCoord(centre.y - reach, m_rows);
        const int y1 = cellCoord(centre.y + reach, m_rows);
        for (int cy = y0; cy <= y1; ++cy) {
            for (int cx = x0; cx <= x1; ++cx) {
                for (const Entry& e : m_cells[static_cast<size_t>(cy) * static_cast<size_t>(m_cols) + static_cast<size_t>(cx)]) {
                    fn(e);
                }
            }
        }
    }

    float m_cellSize = 64.0f;
    int m_cols = 1;
    int m_rows = 1;
    std::vector<std::vector<Entry>> m_cells = std::vector<std::vector<Entry>>(1);
    float m_maxRadius = 0.0f;
    size_t m_size = 0;
};

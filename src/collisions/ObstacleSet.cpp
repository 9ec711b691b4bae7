/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/ObstacleSet.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>

namespace Deadlock {

ObstacleSet::ObstacleSet(std::vector<Obstacle> obstacles, std::optional<AABB> worldBounds,
                         float cellSize)
    : m_obstacles(std::move(obstacles)), m_worldBounds(worldBounds), m_grid(cellSize) {
    for (size_t i = 0; i < m_obstacles.size(); ++i) {
        const Obstacle& o = m_obstacles[i];
        if (!o.isValid()) {
            throw std::invalid_argument(std::format(
                "Obstacle {} has invalid geometry (center ({}, {}), radius {}, half size ({}, {}))",
                i, o.center.getX(), o.center.getY(), o.radius, o.halfSize.getX(), o.halfSize.getY()));
        }
        m_grid.insert(static_cast<EntityID>(i), o.bounds());
    }

    if (m_worldBounds) {
        const AABB& b = *m_worldBounds;
        if (!b.center.isFinite() || !b.halfSize.isFinite() ||
            b.halfSize.getX() <= 0.0f || b.halfSize.getY() <= 0.0f) {
            throw std::invalid_argument(std::format(
                "World bounds must have positive finite extents, got half size ({}, {})",
                b.halfSize.getX(), b.halfSize.getY()));
        }
    }

    COLLISION_INFO(std::format("Obstacle set built: {} obstacles, {} grid cells",
                               m_obstacles.size(), m_grid.cellCount()));
}

void ObstacleSet::query(const AABB& area, std::vector<size_t>& out) const {
    thread_local std::vector<EntityID> ids;
    m_grid.query(area, ids);
    out.clear();
    out.reserve(ids.size());
    for (EntityID id : ids) {
        out.push_back(static_cast<size_t>(id));
    }
    std::sort(out.begin(), out.end());
}

bool ObstacleSet::overlapsCircle(const Vector2D& c, float r, float tolerance) const {
    thread_local std::vector<size_t> nearby;
    query(AABB(c.getX(), c.getY(), r, r), nearby);
    for (size_t index : nearby) {
        if (m_obstacles[index].penetrationDepth(c, r) > tolerance) {
            return true;
        }
    }
    return false;
}

Vector2D ObstacleSet::clampToBounds(const Vector2D& c, float r) const {
    if (!m_worldBounds) {
        return c;
    }
    const AABB& b = *m_worldBounds;
    // A body wider than the map is pinned to the center on that axis
    const float minX = std::min(b.left() + r, b.center.getX());
    const float maxX = std::max(b.right() - r, b.center.getX());
    const float minY = std::min(b.top() + r, b.center.getY());
    const float maxY = std::max(b.bottom() - r, b.center.getY());
    return Vector2D(std::clamp(c.getX(), minX, maxX), std::clamp(c.getY(), minY, maxY));
}

bool ObstacleSet::isOutOfBounds(const Vector2D& p) const {
    return m_worldBounds && !m_worldBounds->contains(p);
}

} // namespace Deadlock

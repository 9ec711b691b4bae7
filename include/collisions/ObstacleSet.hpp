/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSTACLE_SET_HPP
#define OBSTACLE_SET_HPP

#include "collisions/Obstacle.hpp"
#include "collisions/SpatialHash.hpp"
#include <optional>
#include <vector>

namespace Deadlock {

/**
 * @brief Immutable obstacle geometry of one map plus its optional bounds.
 *
 * Built once at level start and shared read-only by CollisionWorld,
 * Navigation and Director. Obstacles are indexed by position in the input
 * vector; those indices are what EntityObstacle events carry in their obstacle field.
 */
class ObstacleSet {
public:
    ObstacleSet() = default;

    /**
     * @throws std::invalid_argument on non-finite centers, non-positive radii
     *         or half extents, or degenerate world bounds
     */
    explicit ObstacleSet(std::vector<Obstacle> obstacles,
                         std::optional<AABB> worldBounds = std::nullopt,
                         float cellSize = 128.0f);

    const std::vector<Obstacle>& obstacles() const { return m_obstacles; }
    const Obstacle& operator[](size_t index) const { return m_obstacles[index]; }
    size_t size() const { return m_obstacles.size(); }
    bool empty() const { return m_obstacles.empty(); }

    const std::optional<AABB>& worldBounds() const { return m_worldBounds; }

    // Indices of obstacles whose bounds may touch area, ascending
    void query(const AABB& area, std::vector<size_t>& out) const;

    // True if circle (c, r) penetrates any obstacle deeper than tolerance
    bool overlapsCircle(const Vector2D& c, float r, float tolerance = 0.0f) const;

    // Clamps a circle's center so it stays inside the world bounds
    Vector2D clampToBounds(const Vector2D& c, float r) const;

    bool isOutOfBounds(const Vector2D& p) const;

private:
    std::vector<Obstacle> m_obstacles;
    std::optional<AABB> m_worldBounds;
    SpatialHash m_grid;
};

} // namespace Deadlock

#endif // OBSTACLE_SET_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OBSTACLE_HPP
#define OBSTACLE_HPP

#include "collisions/AABB.hpp"
#include <cstdint>
#include <optional>

namespace Deadlock {

/**
 * @brief Static map geometry: a circle or an axis-aligned box.
 *
 * Obstacles have infinite mass; resolution only ever moves the entity.
 */
struct Obstacle {
    enum class Shape : uint8_t { Circle, Box };

    Shape shape{Shape::Circle};
    Vector2D center{0, 0};
    float radius{0.0f};        // Circle only
    Vector2D halfSize{0, 0};   // Box only
    bool blocksProjectiles{true};

    static Obstacle circle(const Vector2D& center, float radius, bool blocksProjectiles = true);
    static Obstacle box(const Vector2D& center, float halfWidth, float halfHeight,
                        bool blocksProjectiles = true);

    AABB bounds() const;
    bool isValid() const;

    /**
     * @brief Minimal translation moving circle (c, r) out of this obstacle
     * @param fallback unit direction used when c sits exactly on a circle center
     * @return nullopt when the circle does not penetrate
     */
    std::optional<Vector2D> penetration(const Vector2D& c, float r, const Vector2D& fallback) const;

    // Penetration depth of circle (c, r), 0 when clear
    float penetrationDepth(const Vector2D& c, float r) const;

    // Entry parameter of segment a->b against this shape grown by inflate
    std::optional<float> segmentEntry(const Vector2D& a, const Vector2D& b, float inflate) const;
};

} // namespace Deadlock

#endif // OBSTACLE_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Obstacle.hpp"
#include "collisions/Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace Deadlock {

Obstacle Obstacle::circle(const Vector2D& center, float radius, bool blocksProjectiles) {
    Obstacle o;
    o.shape = Shape::Circle;
    o.center = center;
    o.radius = radius;
    o.blocksProjectiles = blocksProjectiles;
    return o;
}

Obstacle Obstacle::box(const Vector2D& center, float halfWidth, float halfHeight,
                       bool blocksProjectiles) {
    Obstacle o;
    o.shape = Shape::Box;
    o.center = center;
    o.halfSize = Vector2D(halfWidth, halfHeight);
    o.blocksProjectiles = blocksProjectiles;
    return o;
}

AABB Obstacle::bounds() const {
    if (shape == Shape::Circle) {
        return AABB(center.getX(), center.getY(), radius, radius);
    }
    return AABB(center.getX(), center.getY(), halfSize.getX(), halfSize.getY());
}

bool Obstacle::isValid() const {
    if (!center.isFinite()) {
        return false;
    }
    if (shape == Shape::Circle) {
        return std::isfinite(radius) && radius > 0.0f;
    }
    return halfSize.isFinite() && halfSize.getX() > 0.0f && halfSize.getY() > 0.0f;
}

std::optional<Vector2D> Obstacle::penetration(const Vector2D& c, float r,
                                              const Vector2D& fallback) const {
    if (shape == Shape::Circle) {
        const Vector2D d = c - center;
        const float distSq = d.lengthSquared();
        const float reach = r + radius;
        if (distSq >= reach * reach) {
            return std::nullopt;
        }
        const float dist = std::sqrt(distSq);
        const Vector2D normal = dist > 1e-6f ? d / dist : fallback;
        return normal * (reach - dist);
    }

    const AABB box = bounds();
    if (box.contains(c)) {
        // Center inside: leave through the nearest face
        const float toLeft = c.getX() - box.left();
        const float toRight = box.right() - c.getX();
        const float toTop = c.getY() - box.top();
        const float toBottom = box.bottom() - c.getY();
        const float nearest = std::min({toLeft, toRight, toTop, toBottom});
        if (nearest == toLeft) return Vector2D(-(toLeft + r), 0.0f);
        if (nearest == toRight) return Vector2D(toRight + r, 0.0f);
        if (nearest == toTop) return Vector2D(0.0f, -(toTop + r));
        return Vector2D(0.0f, toBottom + r);
    }

    const Vector2D closest = box.closestPoint(c);
    const Vector2D d = c - closest;
    const float distSq = d.lengthSquared();
    if (distSq >= r * r) {
        return std::nullopt;
    }
    const float dist = std::sqrt(distSq);
    return (d / dist) * (r - dist);
}

float Obstacle::penetrationDepth(const Vector2D& c, float r) const {
    auto push = penetration(c, r, Vector2D(1.0f, 0.0f));
    return push ? push->length() : 0.0f;
}

std::optional<float> Obstacle::segmentEntry(const Vector2D& a, const Vector2D& b,
                                            float inflate) const {
    if (shape == Shape::Circle) {
        return Geometry::segmentCircleEntry(a, b, center, radius + inflate);
    }
    return bounds().segmentEntry(a, b, inflate);
}

} // namespace Deadlock

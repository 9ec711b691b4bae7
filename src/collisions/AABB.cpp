/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Deadlock {

AABB AABB::fromMinMax(const Vector2D& min, const Vector2D& max) {
    const float minX = std::min(min.getX(), max.getX());
    const float maxX = std::max(min.getX(), max.getX());
    const float minY = std::min(min.getY(), max.getY());
    const float maxY = std::max(min.getY(), max.getY());
    return AABB((minX + maxX) * 0.5f, (minY + maxY) * 0.5f,
                (maxX - minX) * 0.5f, (maxY - minY) * 0.5f);
}

bool AABB::intersects(const AABB& other) const {
    // Non-strict separation so edge-touching is NOT a collision
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    return Vector2D{std::clamp(p.getX(), left(), right()),
                    std::clamp(p.getY(), top(), bottom())};
}

AABB AABB::inflated(float amount) const {
    return AABB(center.getX(), center.getY(),
                halfSize.getX() + amount, halfSize.getY() + amount);
}

std::optional<float> AABB::segmentEntry(const Vector2D& a, const Vector2D& b,
                                        float inflate) const {
    const AABB box = inflated(inflate);
    if (box.contains(a)) {
        return 0.0f;
    }

    const float d[2] = {b.getX() - a.getX(), b.getY() - a.getY()};
    const float origin[2] = {a.getX(), a.getY()};
    const float minB[2] = {box.left(), box.top()};
    const float maxB[2] = {box.right(), box.bottom()};

    float tMin = 0.0f;
    float tMax = 1.0f;
    for (int axis = 0; axis < 2; ++axis) {
        if (std::abs(d[axis]) < 1e-8f) {
            // Parallel to this slab: must already be within it
            if (origin[axis] < minB[axis] || origin[axis] > maxB[axis]) {
                return std::nullopt;
            }
            continue;
        }
        const float inv = 1.0f / d[axis];
        float t1 = (minB[axis] - origin[axis]) * inv;
        float t2 = (maxB[axis] - origin[axis]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return std::nullopt;
        }
    }
    return tMin;
}

} // namespace Deadlock

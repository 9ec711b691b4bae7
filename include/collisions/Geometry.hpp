/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include <optional>

namespace Deadlock::Geometry {

constexpr float PI = 3.14159265358979323846f;

inline float degToRad(float degrees) { return degrees * (PI / 180.0f); }

/**
 * @brief First time of contact of segment a->b with circle (center, radius)
 * @return parameter in [0, 1] (0 when a starts inside), or nullopt
 */
std::optional<float> segmentCircleEntry(const Vector2D& a, const Vector2D& b,
                                        const Vector2D& center, float radius);

/**
 * @brief Unit direction used when two shapes share the exact same center.
 *
 * Derived only from the ordered id pair so the same pair always separates
 * the same way, independent of container order.
 */
Vector2D tieBreakDirection(EntityID lowId, EntityID highId);

} // namespace Deadlock::Geometry

#endif // GEOMETRY_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Geometry.hpp"
#include <cmath>

namespace Deadlock::Geometry {

std::optional<float> segmentCircleEntry(const Vector2D& a, const Vector2D& b,
                                        const Vector2D& center, float radius) {
    const Vector2D d = b - a;
    const Vector2D f = a - center;

    const float c = f.lengthSquared() - radius * radius;
    if (c <= 0.0f) {
        return 0.0f; // starts inside
    }

    const float aCoeff = d.lengthSquared();
    if (aCoeff < 1e-12f) {
        return std::nullopt; // stationary and outside
    }

    const float bCoeff = 2.0f * f.dot(d);
    const float disc = bCoeff * bCoeff - 4.0f * aCoeff * c;
    if (disc < 0.0f) {
        return std::nullopt;
    }

    const float t = (-bCoeff - std::sqrt(disc)) / (2.0f * aCoeff);
    if (t < 0.0f || t > 1.0f) {
        return std::nullopt;
    }
    return t;
}

Vector2D tieBreakDirection(EntityID lowId, EntityID highId) {
    // splitmix64 finalizer over the packed pair
    uint64_t h = lowId * 0x9E3779B97F4A7C15ull ^ (highId + 0x632BE59BD9B4E019ull);
    h ^= h >> 30;
    h *= 0xBF58476D1CE4E5B9ull;
    h ^= h >> 27;
    h *= 0x94D049BB133111EBull;
    h ^= h >> 31;

    const float angle = static_cast<float>(h % 3600u) * (2.0f * PI / 3600.0f);
    return Vector2D(std::cos(angle), std::sin(angle));
}

} // namespace Deadlock::Geometry

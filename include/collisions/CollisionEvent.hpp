/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_EVENT_HPP
#define COLLISION_EVENT_HPP

#include "entities/Entity.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace Deadlock {

enum class CollisionKind : uint8_t {
    EntityEntity = 0,   // a < b, both solid bodies
    EntityObstacle = 1, // a = entity or projectile, b unset, obstacle = index
    ProjectileHit = 2,  // a = projectile, b = struck entity
    ExplosionHit = 3,   // a = projectile, b = entity inside the blast
    PickupContact = 4   // a = player, b = pickup
};

const char* toString(CollisionKind kind);

inline std::ostream& operator<<(std::ostream& os, CollisionKind kind) {
    return os << toString(kind);
}

struct CollisionEvent {
    EntityID a{INVALID_ENTITY_ID};
    EntityID b{INVALID_ENTITY_ID};
    CollisionKind kind{CollisionKind::EntityEntity};
    Vector2D penetration{0, 0}; // displacement that separated (or would separate) a from b
    Vector2D point{0, 0};       // contact or impact point
    std::optional<size_t> obstacle; // ObstacleSet index, EntityObstacle events only
};

} // namespace Deadlock

#endif // COLLISION_EVENT_HPP

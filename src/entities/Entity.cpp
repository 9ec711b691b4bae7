/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Entity.hpp"

namespace Deadlock {

const char* toString(EntityKind kind) {
    switch (kind) {
    case EntityKind::Player:
        return "Player";
    case EntityKind::Zombie:
        return "Zombie";
    case EntityKind::Projectile:
        return "Projectile";
    case EntityKind::Pickup:
        return "Pickup";
    default:
        return "Unknown";
    }
}

const char* toString(ZombieType type) {
    switch (type) {
    case ZombieType::Weak:
        return "Weak";
    case ZombieType::Fast:
        return "Fast";
    case ZombieType::Tough:
        return "Tough";
    default:
        return "Unknown";
    }
}

} // namespace Deadlock

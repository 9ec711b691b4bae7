/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ZOMBIE_ARCHETYPES_HPP
#define ZOMBIE_ARCHETYPES_HPP

#include "entities/Entity.hpp"
#include <array>

namespace Deadlock
{

/**
 * Per-type zombie stats
 *
 * Speed is drawn uniformly from [speedMin, speedMax] at spawn.
 */
struct ZombieArchetype
{
    float radius = 12.0f;                         // Collision radius (px)
    float speedMin = 50.0f;                       // px/s
    float speedMax = 80.0f;                       // px/s
    float health = 100.0f;
    float contactDamage = 10.0f;                  // Damage per attack
    float attackRange = 6.0f;                     // Surface distance (px) at which attacks land
    float attackCooldown = 1.0f;                  // Seconds between attacks
    int scoreValue = 10;                          // Points awarded on kill
    float mass = 1.0f;                            // Share of pair separation is 1/mass
};

using ZombieArchetypeTable = std::array<ZombieArchetype, ZOMBIE_TYPE_COUNT>;

inline const ZombieArchetype& archetypeFor(const ZombieArchetypeTable& table, ZombieType type) {
    return table[static_cast<size_t>(type)];
}

inline ZombieArchetypeTable defaultZombieArchetypes() {
    ZombieArchetypeTable table{};

    ZombieArchetype& weak = table[static_cast<size_t>(ZombieType::Weak)];
    weak.radius = 12.0f;
    weak.speedMin = 50.0f;
    weak.speedMax = 80.0f;
    weak.health = 100.0f;
    weak.contactDamage = 10.0f;
    weak.attackRange = 6.0f;
    weak.attackCooldown = 1.0f;
    weak.scoreValue = 10;
    weak.mass = 1.0f;

    // Small, quick, fragile
    ZombieArchetype& fast = table[static_cast<size_t>(ZombieType::Fast)];
    fast.radius = 9.0f;
    fast.speedMin = 110.0f;
    fast.speedMax = 150.0f;
    fast.health = 50.0f;
    fast.contactDamage = 5.0f;
    fast.attackRange = 6.0f;
    fast.attackCooldown = 0.6f;
    fast.scoreValue = 15;
    fast.mass = 1.0f;

    // Large, slow, hits hard
    ZombieArchetype& tough = table[static_cast<size_t>(ZombieType::Tough)];
    tough.radius = 18.0f;
    tough.speedMin = 35.0f;
    tough.speedMax = 55.0f;
    tough.health = 250.0f;
    tough.contactDamage = 20.0f;
    tough.attackRange = 8.0f;
    tough.attackCooldown = 1.5f;
    tough.scoreValue = 30;
    tough.mass = 1.0f;

    return table;
}

} // namespace Deadlock

#endif // ZOMBIE_ARCHETYPES_HPP

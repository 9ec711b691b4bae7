/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/ZombieFactory.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Deadlock {

Entity ZombieFactory::build(ZombieType type, const Vector2D& position) {
    const ZombieArchetype& archetype = archetypeFor(m_archetypes, type);

    Entity e;
    e.kind = EntityKind::Zombie;
    e.position = position;
    e.radius = archetype.radius;
    e.mass = archetype.mass;
    e.health = archetype.health;
    e.maxHealth = archetype.health;

    e.zombie.type = type;
    e.zombie.speed = m_random.uniform(archetype.speedMin, archetype.speedMax);
    e.zombie.contactDamage = archetype.contactDamage;
    e.zombie.attackRange = archetype.attackRange;
    e.zombie.attackCooldown = archetype.attackCooldown;
    e.zombie.scoreValue = archetype.scoreValue;
    return e;
}

EntityID ZombieFactory::spawn(ZombieType type, const Vector2D& position) {
    const EntityID id = m_registry.create(build(type, position));
    ENTITY_DEBUG(std::format("Spawned {} zombie {} at ({:.1f}, {:.1f})", toString(type), id,
                             position.getX(), position.getY()));
    return id;
}

} // namespace Deadlock

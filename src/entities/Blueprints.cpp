/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Blueprints.hpp"

namespace Deadlock::Blueprints {

Entity player(const Vector2D& position, float radius, float health) {
    Entity e;
    e.kind = EntityKind::Player;
    e.position = position;
    e.radius = radius;
    e.health = health;
    e.maxHealth = health;
    return e;
}

Entity projectile(EntityID owner, const Vector2D& position, const Vector2D& velocity,
                  float damage, float range, float explosionRadius, float radius) {
    Entity e;
    e.kind = EntityKind::Projectile;
    e.position = position;
    e.velocity = velocity;
    e.radius = radius;
    e.projectile.owner = owner;
    e.projectile.damage = damage;
    e.projectile.remainingRange = range;
    e.projectile.explosionRadius = explosionRadius;
    return e;
}

Entity pickup(const Vector2D& position, float healAmount, float radius) {
    Entity e;
    e.kind = EntityKind::Pickup;
    e.position = position;
    e.radius = radius;
    e.pickup.healAmount = healAmount;
    return e;
}

} // namespace Deadlock::Blueprints

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/CombatResolver.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace Deadlock {

void CombatResolver::applyZombieAttack(const Entity& zombie, Entity& player, float damage) {
    if (!player.alive || !player.health || *player.health <= 0.0f) {
        return;
    }

    player.health = std::max(0.0f, *player.health - damage);
    m_damageTaken += damage;
    COMBAT_DEBUG(std::format("Zombie {} hits player for {} ({} left)", zombie.id, damage, *player.health));

    if (*player.health <= 0.0f) {
        // Registry is not reachable from here; the removal happens in consume()
        m_pendingPlayerDeaths.push_back(player.id);
    }
}

void CombatResolver::consume(const std::vector<CollisionEvent>& events, EntityRegistry& registry) {
    for (EntityID id : m_pendingPlayerDeaths) {
        if (registry.markForRemoval(id)) {
            m_playerDead = true;
            COMBAT_INFO(std::format("Player {} killed by zombies", id));
        }
    }
    m_pendingPlayerDeaths.clear();

    for (const CollisionEvent& event : events) {
        switch (event.kind) {
        case CollisionKind::ProjectileHit:
            applyHit(registry, event, false);
            break;
        case CollisionKind::ExplosionHit:
            applyHit(registry, event, true);
            break;
        case CollisionKind::PickupContact:
            applyPickup(registry, event);
            break;
        case CollisionKind::EntityEntity:
        case CollisionKind::EntityObstacle:
            break;
        }
    }
}

bool CombatResolver::damage(EntityRegistry& registry, Entity& target, float amount) {
    if (!target.alive || !target.health) {
        return false;
    }
    target.health = std::max(0.0f, *target.health - amount);
    if (*target.health > 0.0f) {
        return false;
    }
    registry.markForRemoval(target.id);
    if (target.kind == EntityKind::Player) {
        m_playerDead = true;
        COMBAT_INFO(std::format("Player {} killed", target.id));
    }
    return true;
}

void CombatResolver::applyHit(EntityRegistry& registry, const CollisionEvent& event, bool explosive) {
    const Entity* projectile = registry.find(event.a);
    Entity* target = registry.find(event.b);
    if (!projectile || !target) {
        return;
    }

    if (damage(registry, *target, projectile->projectile.damage) && target->kind == EntityKind::Zombie) {
        m_score.recordKill(target->zombie.type, target->zombie.scoreValue, explosive);
    }
}

void CombatResolver::applyPickup(EntityRegistry& registry, const CollisionEvent& event) {
    Entity* player = registry.find(event.a);
    Entity* pickup = registry.find(event.b);
    // A pickup is consumed once even if two contacts land in the same tick
    if (!player || !pickup || !player->alive || !pickup->alive || !player->health) {
        return;
    }

    const float cap = player->maxHealth.value_or(*player->health);
    player->health = std::min(cap, *player->health + pickup->pickup.healAmount);
    registry.markForRemoval(pickup->id);
    COMBAT_DEBUG(std::format("Player {} picked up {} (+{} health)", player->id, pickup->id,
                             pickup->pickup.healAmount));
}

} // namespace Deadlock

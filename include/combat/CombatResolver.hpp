/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMBAT_RESOLVER_HPP
#define COMBAT_RESOLVER_HPP

#include "combat/ScoreTracker.hpp"
#include "core/Collaborators.hpp"
#include "entities/EntityRegistry.hpp"

namespace Deadlock {

/**
 * @brief Applies the health changes implied by a tick's events
 *
 * - ProjectileHit / ExplosionHit: projectile damage to the target
 * - PickupContact: heals the player (capped at max health), consumes pickup
 * - zombie attacks (via DamageSink): contact damage to the player
 *
 * Anything whose health reaches zero is marked for removal; zombie deaths are
 * credited to the ScoreTracker. EntityEntity and EntityObstacle events carry
 * no damage.
 */
class CombatResolver : public DamageSink, public CollisionEventSink {
public:
    explicit CombatResolver(ScoreTracker& score) : m_score(score) {}

    void applyZombieAttack(const Entity& zombie, Entity& player, float damage) override;
    void consume(const std::vector<CollisionEvent>& events, EntityRegistry& registry) override;

    bool isPlayerDead() const { return m_playerDead; }
    float getDamageTaken() const { return m_damageTaken; }

private:
    // Returns true if this hit killed the target
    bool damage(EntityRegistry& registry, Entity& target, float amount);
    void applyHit(EntityRegistry& registry, const CollisionEvent& event, bool explosive);
    void applyPickup(EntityRegistry& registry, const CollisionEvent& event);

    ScoreTracker& m_score;
    bool m_playerDead{false};
    float m_damageTaken{0.0f};
    std::vector<EntityID> m_pendingPlayerDeaths;
};

} // namespace Deadlock

#endif // COMBAT_RESOLVER_HPP

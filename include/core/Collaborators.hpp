/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include "collisions/CollisionEvent.hpp"
#include "entities/Entity.hpp"
#include <cstdint>
#include <vector>

namespace Deadlock {

class EntityRegistry;

// Survival time and score, advanced outside the simulation core
class ScoreSource {
public:
    virtual ~ScoreSource() = default;
    virtual float elapsedSeconds() const = 0;
    virtual int64_t score() const = 0;
};

// Turns a SpawnRequest into a registered zombie
class EntityFactory {
public:
    virtual ~EntityFactory() = default;
    virtual EntityID spawn(ZombieType type, const Vector2D& position) = 0;
};

// Receives melee damage decided by Navigation
class DamageSink {
public:
    virtual ~DamageSink() = default;
    virtual void applyZombieAttack(const Entity& zombie, Entity& player, float damage) = 0;
};

// Consumes the tick's collision events (weapon hits, contact, pickups)
class CollisionEventSink {
public:
    virtual ~CollisionEventSink() = default;
    virtual void consume(const std::vector<CollisionEvent>& events, EntityRegistry& registry) = 0;
};

} // namespace Deadlock

#endif // COLLABORATORS_HPP

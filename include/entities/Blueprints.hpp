/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BLUEPRINTS_HPP
#define BLUEPRINTS_HPP

#include "entities/Entity.hpp"

namespace Deadlock::Blueprints {

// Unregistered entity records; pass the result to EntityRegistry::create()

Entity player(const Vector2D& position, float radius = 14.0f, float health = 100.0f);

Entity projectile(EntityID owner, const Vector2D& position, const Vector2D& velocity,
                  float damage = 25.0f, float range = 1200.0f, float explosionRadius = 0.0f,
                  float radius = 2.0f);

Entity pickup(const Vector2D& position, float healAmount = 25.0f, float radius = 10.0f);

} // namespace Deadlock::Blueprints

#endif // BLUEPRINTS_HPP

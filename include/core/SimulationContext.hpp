/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONTEXT_HPP
#define SIMULATION_CONTEXT_HPP

#include "collisions/ObstacleSet.hpp"
#include "entities/EntityRegistry.hpp"
#include "utils/Random.hpp"
#include <cstdint>

namespace Deadlock {

/**
 * @brief Everything one tick's systems may read or mutate.
 *
 * Built fresh by Simulation for every tick and passed explicitly to Director,
 * Navigation and CollisionWorld. Systems hold no pointers into it between
 * ticks.
 */
struct SimulationContext {
    EntityRegistry& entities;
    const ObstacleSet& obstacles;
    Random& random;
    EntityID player{INVALID_ENTITY_ID};
    float deltaTime{1.0f / 60.0f};
    uint64_t tick{0};
};

} // namespace Deadlock

#endif // SIMULATION_CONTEXT_HPP

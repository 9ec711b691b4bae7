/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COLLISION_CONFIG_HPP
#define COLLISION_CONFIG_HPP

namespace Deadlock
{

/**
 * Configuration for CollisionWorld
 *
 * Broad phase grid, solver effort and contact tolerances.
 */
struct CollisionConfig
{
    // Broad phase
    float cellSize = 64.0f;                       // Grid cell size (px), raised to the largest diameter if smaller

    // Solver
    int solverIterations = 64;                    // Pass cap; resolution stops once no pair overlaps
    float overlapEpsilon = 0.01f;                 // Penetration (px) at or below this is ignored

    // Pickups
    float pickupRadiusMultiplier = 2.0f;          // Contact reach = multiplier * (rPlayer + rPickup)
};

} // namespace Deadlock

#endif // COLLISION_CONFIG_HPP

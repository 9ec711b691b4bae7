/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PICKUP_SPAWN_CONFIG_HPP
#define PICKUP_SPAWN_CONFIG_HPP

namespace Deadlock
{

/**
 * Configuration for PickupSpawner
 *
 * Health pickups dropped at random open spots across the whole map.
 */
struct PickupSpawnConfig
{
    bool enabled = true;                          // false: no pickups are ever scheduled
    float spawnInterval = 8.0f;                   // Seconds between spawn cycles
    int maxActive = 20;                           // Cycles wait while this many pickups are alive

    // Pickup
    float healAmount = 25.0f;                     // Health restored on contact
    float radius = 10.0f;                         // Pickup body radius (px)

    // Placement
    float obstacleClearance = 32.0f;              // Free space (px) around the center; must cover the radius
    float minSeparation = 50.0f;                  // Min distance to any live pickup (px)
    int maxSpawnAttempts = 50;                    // Candidates drawn per spawn cycle
};

} // namespace Deadlock

#endif // PICKUP_SPAWN_CONFIG_HPP

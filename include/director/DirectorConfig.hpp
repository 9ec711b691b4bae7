/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef DIRECTOR_CONFIG_HPP
#define DIRECTOR_CONFIG_HPP

#include "entities/Entity.hpp"
#include <array>
#include <vector>

namespace Deadlock
{

/**
 * Zombie type weights in effect from a given survival time on
 *
 * Weights between two breakpoints are linearly interpolated.
 */
struct TypeWeightBreakpoint
{
    float time = 0.0f;                            // Survival time (s)
    std::array<float, ZOMBIE_TYPE_COUNT> weights{1.0f, 0.0f, 0.0f}; // Weak, Fast, Tough
};

/**
 * Configuration for Director
 *
 * Spawn pacing, population target and spawn placement rules.
 */
struct DirectorConfig
{
    // Population target: min(maxCount, baseCount + floor(countRate * T))
    int baseCount = 5;                            // Target at T = 0
    float countRate = 0.1f;                       // Extra zombies per survived second
    int maxCount = 50;                            // Hard cap on concurrent zombies

    // Spawn interval
    float initialSpawnInterval = 2.0f;            // Seconds between spawn attempts at T = 0
    float minSpawnInterval = 0.5f;                // Interval floor
    float intervalDecay = 0.1f;                   // Seconds removed from the interval per decay period
    float intervalDecayPeriod = 30.0f;            // Survival seconds per decay step

    // Placement
    float minSpawnRadius = 500.0f;                // Ring inner radius around the player (px)
    float maxSpawnRadius = 800.0f;                // Ring outer radius (px)
    float minDistanceFromPlayer = 400.0f;         // Hard lower bound after clamping to the map (px)
    float minSpawnSeparation = 40.0f;             // Min distance to any existing zombie (px)
    float spawnClearance = 18.0f;                 // Obstacle clearance; must cover the largest zombie radius
    int maxSpawnAttempts = 20;                    // Candidates drawn per spawn cycle

    // Opening wave placed before the first tick
    int initialCount = 5;

    std::vector<TypeWeightBreakpoint> typeWeights{
        {0.0f, {1.0f, 0.0f, 0.0f}},
        {30.0f, {0.7f, 0.2f, 0.1f}},
        {90.0f, {0.5f, 0.3f, 0.2f}},
        {180.0f, {0.35f, 0.35f, 0.3f}}};
};

} // namespace Deadlock

#endif // DIRECTOR_CONFIG_HPP

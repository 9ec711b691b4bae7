/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NAVIGATION_CONFIG_HPP
#define NAVIGATION_CONFIG_HPP

#include <vector>

namespace Deadlock
{

/**
 * Configuration for Navigation
 *
 * Stuck detection and probe steering thresholds. Zombie speed, attack range
 * and cooldown are per-entity (see ZombieData), not configured here.
 */
struct NavigationConfig
{
    // Stuck detection
    float stuckEpsilon = 0.5f;                    // Net displacement (px) per tick below which a tick counts as stuck
    int stuckTicks = 10;                          // Consecutive stuck ticks before probing (K)

    // Probing
    float probeDistance = 24.0f;                  // How far ahead (px) each candidate heading is tested
    float probeTimeout = 1.5f;                    // Seconds of probing before falling back to seeking
    float probeTolerance = 0.01f;                 // Obstacle penetration (px) still counted as clear
    std::vector<float> probeAngles{0.0f, 45.0f, -45.0f, 90.0f, -90.0f, 180.0f}; // Degrees from desired heading, tried in order
};

} // namespace Deadlock

#endif // NAVIGATION_CONFIG_HPP

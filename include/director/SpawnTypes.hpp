/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPAWN_TYPES_HPP
#define SPAWN_TYPES_HPP

#include "entities/Entity.hpp"
#include <array>
#include <cstdint>

namespace Deadlock {

struct SpawnRequest {
    ZombieType type{ZombieType::Weak};
    Vector2D position{0, 0};
};

// Recomputed every tick; never persisted
struct SpawnDirective {
    std::array<float, ZOMBIE_TYPE_COUNT> weights{1.0f, 0.0f, 0.0f}; // sums to 1
    int targetCount{0};
    float spawnInterval{0.0f};            // current interval length
    float spawnIntervalRemaining{0.0f};   // countdown to the next attempt
    float elapsedSeconds{0.0f};
    int64_t score{0};
};

} // namespace Deadlock

#endif // SPAWN_TYPES_HPP

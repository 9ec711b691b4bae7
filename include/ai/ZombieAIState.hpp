/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ZOMBIE_AI_STATE_HPP
#define ZOMBIE_AI_STATE_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <ostream>

namespace Deadlock {

enum class NavMode : uint8_t {
    Seeking = 0,
    Probing = 1,
    Attacking = 2
};

const char* toString(NavMode mode);

inline std::ostream& operator<<(std::ostream& os, NavMode mode) {
    return os << toString(mode);
}

struct ZombieAIState {
    NavMode mode{NavMode::Seeking};
    int stuckTicks{0};               // consecutive ticks below stuckEpsilon
    Vector2D probeHeading{0, 0};     // zero while no clear candidate is held
    float probeTimer{0.0f};          // seconds of probing left
    float attackCooldown{0.0f};      // seconds until the next attack is allowed

    // Per-tick bookkeeping
    Vector2D tickStart{0, 0};        // position before movement
    bool engaged{false};             // within attack range of the player this tick
    bool hasTarget{false};
};

} // namespace Deadlock

#endif // ZOMBIE_AI_STATE_HPP

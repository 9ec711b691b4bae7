/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "combat/ScoreTracker.hpp"
#include "core/Logger.hpp"
#include <format>

namespace Deadlock {

void ScoreTracker::advance(float deltaTime) {
    if (deltaTime > 0.0f) {
        m_elapsed += deltaTime;
    }
}

void ScoreTracker::recordKill(ZombieType type, int scoreValue, bool explosive) {
    const int awarded = scoreValue + (explosive ? EXPLOSIVE_KILL_BONUS : 0);
    m_score += awarded;
    ++m_totalKills;
    ++m_kills[static_cast<size_t>(type)];

    COMBAT_DEBUG(std::format("{} zombie killed{}: +{} (score {})", toString(type),
                             explosive ? " by explosion" : "", awarded, m_score));
}

void ScoreTracker::reset() {
    m_elapsed = 0.0;
    m_score = 0;
    m_totalKills = 0;
    m_kills.fill(0);
}

} // namespace Deadlock

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCORE_TRACKER_HPP
#define SCORE_TRACKER_HPP

#include "core/Collaborators.hpp"
#include <array>
#include <cstdint>

namespace Deadlock {

/**
 * @brief Survival time and kill score
 *
 * Advanced by the simulation once per tick; read by the Director.
 */
class ScoreTracker : public ScoreSource {
public:
    static constexpr int EXPLOSIVE_KILL_BONUS = 5;

    float elapsedSeconds() const override { return static_cast<float>(m_elapsed); }
    int64_t score() const override { return m_score; }

    void advance(float deltaTime);
    void recordKill(ZombieType type, int scoreValue, bool explosive);

    uint32_t getKills() const { return m_totalKills; }
    uint32_t getKills(ZombieType type) const { return m_kills[static_cast<size_t>(type)]; }

    void reset();

private:
    double m_elapsed{0.0};
    int64_t m_score{0};
    uint32_t m_totalKills{0};
    std::array<uint32_t, ZOMBIE_TYPE_COUNT> m_kills{};
};

} // namespace Deadlock

#endif // SCORE_TRACKER_HPP

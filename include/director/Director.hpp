/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DIRECTOR_HPP
#define DIRECTOR_HPP

#include "core/Collaborators.hpp"
#include "core/SimulationContext.hpp"
#include "director/DirectorConfig.hpp"
#include "director/SpawnTypes.hpp"
#include <array>
#include <optional>
#include <vector>

namespace Deadlock {

/**
 * @brief Decides when, where and what to spawn from survival time.
 *
 * Time and score are read from a ScoreSource; the Director never advances
 * them. Spawns are only requested, never created: the caller hands each
 * SpawnRequest to an EntityFactory.
 *
 * A failed placement (every candidate rejected) is not an error; the cycle
 * is skipped with a warning and retried after a full interval.
 */
class Director {
public:
    /**
     * @throws std::invalid_argument on negative counts or rates, cap below
     *         base, inverted spawn ring, non-positive intervals, unsorted or
     *         all-zero type weight breakpoints
     */
    explicit Director(const DirectorConfig& config = DirectorConfig{});

    /**
     * @brief Advances the spawn timer by one tick and appends any spawn
     * @return the directive in effect this tick
     */
    const SpawnDirective& update(SimulationContext& context, const ScoreSource& score,
                                 std::vector<SpawnRequest>& out);

    // Places the opening wave; only called before the first tick
    void seedInitialWave(SimulationContext& context, std::vector<SpawnRequest>& out);

    int targetCount(float elapsedSeconds) const;
    std::array<float, ZOMBIE_TYPE_COUNT> typeWeights(float elapsedSeconds) const;
    float spawnInterval(float elapsedSeconds) const;

    /**
     * @brief Draws up to maxSpawnAttempts ring candidates around playerPos
     * @param pending spawns already requested but not yet registered
     */
    std::optional<Vector2D> findSpawnPoint(const SimulationContext& context, const Vector2D& playerPos,
                                           const std::vector<SpawnRequest>& pending) const;

    bool isValidSpawnPoint(const SimulationContext& context, const Vector2D& point,
                           const Vector2D& playerPos, const std::vector<SpawnRequest>& pending) const;

    ZombieType drawType(const std::array<float, ZOMBIE_TYPE_COUNT>& weights, Random& random) const;

    const SpawnDirective& getDirective() const { return m_directive; }
    const DirectorConfig& getConfig() const { return m_config; }
    size_t getSkippedCycles() const { return m_skippedCycles; }

private:
    Vector2D sampleRing(Random& random, const Vector2D& center) const;
    Vector2D clampToMap(const ObstacleSet& obstacles, const Vector2D& point) const;

    DirectorConfig m_config;
    SpawnDirective m_directive;
    float m_timer;
    int m_lastTarget{-1};
    size_t m_skippedCycles{0};
};

} // namespace Deadlock

#endif // DIRECTOR_HPP

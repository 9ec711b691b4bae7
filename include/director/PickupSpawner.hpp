/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PICKUP_SPAWNER_HPP
#define PICKUP_SPAWNER_HPP

#include "core/SimulationContext.hpp"
#include "director/PickupSpawnConfig.hpp"
#include <optional>

namespace Deadlock {

/**
 * @brief Schedules health pickups on a fixed interval, up to a live cap.
 *
 * Candidates are drawn uniformly inside the world bounds and must be clear of
 * obstacles and of other pickups. Like the Director it only decides where;
 * the caller registers the pickup.
 *
 * While the cap is reached the timer stays expired, so a pickup appears as
 * soon as one is consumed. A cycle with no valid candidate is skipped.
 */
class PickupSpawner {
public:
    /**
     * @throws std::invalid_argument on a non-positive interval, heal amount
     *         or radius, negative cap or separation, clearance below the
     *         radius or fewer than one attempt
     */
    explicit PickupSpawner(const PickupSpawnConfig& config = PickupSpawnConfig{});

    // Advances the timer by one tick; returns where to place a pickup, if anywhere
    std::optional<Vector2D> update(SimulationContext& context);

    std::optional<Vector2D> findSpawnPoint(SimulationContext& context) const;
    bool isValidSpawnPoint(const SimulationContext& context, const Vector2D& point) const;

    float getTimeRemaining() const { return m_timer; }
    size_t getSkippedCycles() const { return m_skippedCycles; }
    const PickupSpawnConfig& getConfig() const { return m_config; }

private:
    PickupSpawnConfig m_config;
    float m_timer;
    size_t m_skippedCycles{0};
};

} // namespace Deadlock

#endif // PICKUP_SPAWNER_HPP

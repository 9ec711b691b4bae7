/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "director/PickupSpawner.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Deadlock {

PickupSpawner::PickupSpawner(const PickupSpawnConfig& config)
    : m_config(config), m_timer(config.spawnInterval) {
    if (!std::isfinite(config.spawnInterval) || config.spawnInterval <= 0.0f) {
        throw std::invalid_argument(std::format("Pickup spawn interval must be positive, got {}",
                                                config.spawnInterval));
    }
    if (config.maxActive < 0) {
        throw std::invalid_argument(std::format("Pickup cap must be >= 0, got {}", config.maxActive));
    }
    if (!std::isfinite(config.healAmount) || config.healAmount <= 0.0f ||
        !std::isfinite(config.radius) || config.radius <= 0.0f) {
        throw std::invalid_argument(std::format("Pickup heal amount {} and radius {} must be positive",
                                                config.healAmount, config.radius));
    }
    if (!std::isfinite(config.obstacleClearance) || config.obstacleClearance < config.radius) {
        throw std::invalid_argument(std::format("Pickup obstacle clearance {} must cover its radius {}",
                                                config.obstacleClearance, config.radius));
    }
    if (!std::isfinite(config.minSeparation) || config.minSeparation < 0.0f) {
        throw std::invalid_argument(std::format("Pickup separation must be >= 0, got {}", config.minSeparation));
    }
    if (config.maxSpawnAttempts < 1) {
        throw std::invalid_argument(std::format("Pickup spawner needs at least one attempt, got {}",
                                                config.maxSpawnAttempts));
    }
}

bool PickupSpawner::isValidSpawnPoint(const SimulationContext& context, const Vector2D& point) const {
    if (!point.isFinite() || context.obstacles.isOutOfBounds(point)) {
        return false;
    }
    if (context.obstacles.overlapsCircle(point, m_config.obstacleClearance)) {
        return false;
    }

    const float separationSq = m_config.minSeparation * m_config.minSeparation;
    bool crowded = false;
    context.entities.forEachAlive(EntityKind::Pickup, [&](const Entity& pickup) {
        if (!crowded && Vector2D::distanceSquared(pickup.position, point) < separationSq) {
            crowded = true;
        }
    });
    return !crowded;
}

std::optional<Vector2D> PickupSpawner::findSpawnPoint(SimulationContext& context) const {
    const std::optional<AABB>& bounds = context.obstacles.worldBounds();
    if (!bounds) {
        return std::nullopt;
    }

    // Keep the clearance circle on the map
    const float margin = std::min({m_config.obstacleClearance, bounds->halfSize.getX(), bounds->halfSize.getY()});
    for (int attempt = 0; attempt < m_config.maxSpawnAttempts; ++attempt) {
        const Vector2D candidate(context.random.uniform(bounds->left() + margin, bounds->right() - margin),
                                 context.random.uniform(bounds->top() + margin, bounds->bottom() - margin));
        if (isValidSpawnPoint(context, candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<Vector2D> PickupSpawner::update(SimulationContext& context) {
    if (!m_config.enabled) {
        return std::nullopt;
    }

    m_timer -= context.deltaTime;
    if (m_timer > 0.0f) {
        return std::nullopt;
    }

    const size_t live = context.entities.countAlive(EntityKind::Pickup);
    if (live >= static_cast<size_t>(m_config.maxActive)) {
        // Hold the timer expired so the next free slot fills at once
        m_timer = 0.0f;
        return std::nullopt;
    }

    m_timer = m_config.spawnInterval;
    auto point = findSpawnPoint(context);
    if (!point) {
        ++m_skippedCycles;
        DIRECTOR_WARN(std::format("No open spot for a pickup after {} attempts, skipping cycle",
                                  m_config.maxSpawnAttempts));
        return std::nullopt;
    }

    DIRECTOR_DEBUG(std::format("Placing pickup at ({:.1f}, {:.1f}), {} live of {}", point->getX(),
                               point->getY(), live, m_config.maxActive));
    return point;
}

} // namespace Deadlock

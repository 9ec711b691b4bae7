/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "director/Director.hpp"
#include "collisions/Geometry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <stdexcept>

namespace Deadlock {

namespace {

bool isNonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

bool isPositive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

} // namespace

Director::Director(const DirectorConfig& config)
    : m_config(config), m_timer(config.initialSpawnInterval) {
    if (config.baseCount < 0 || config.maxCount < config.baseCount) {
        throw std::invalid_argument(std::format(
            "Director counts invalid: base {} must be >= 0 and <= cap {}", config.baseCount, config.maxCount));
    }
    if (!isNonNegative(config.countRate)) {
        throw std::invalid_argument(std::format("Director count rate must be >= 0, got {}", config.countRate));
    }
    if (!isPositive(config.initialSpawnInterval) || !isPositive(config.minSpawnInterval) ||
        config.minSpawnInterval > config.initialSpawnInterval) {
        throw std::invalid_argument(std::format(
            "Director spawn interval invalid: initial {} and floor {} must be positive, floor <= initial",
            config.initialSpawnInterval, config.minSpawnInterval));
    }
    if (!isNonNegative(config.intervalDecay) || !isPositive(config.intervalDecayPeriod)) {
        throw std::invalid_argument(std::format(
            "Director interval decay invalid: decay {} must be >= 0, period {} must be positive",
            config.intervalDecay, config.intervalDecayPeriod));
    }
    if (!isNonNegative(config.minSpawnRadius) || !isNonNegative(config.maxSpawnRadius) ||
        config.maxSpawnRadius < config.minSpawnRadius) {
        throw std::invalid_argument(std::format(
            "Director spawn ring invalid: [{}, {}]", config.minSpawnRadius, config.maxSpawnRadius));
    }
    if (!isNonNegative(config.minDistanceFromPlayer) || config.minDistanceFromPlayer > config.maxSpawnRadius) {
        throw std::invalid_argument(std::format(
            "Director minDistanceFromPlayer {} must be >= 0 and within the spawn ring (max {})",
            config.minDistanceFromPlayer, config.maxSpawnRadius));
    }
    if (!isNonNegative(config.minSpawnSeparation) || !isNonNegative(config.spawnClearance)) {
        throw std::invalid_argument("Director spawn separation and clearance must be >= 0");
    }
    if (config.maxSpawnAttempts < 1) {
        throw std::invalid_argument(std::format(
            "Director needs at least one spawn attempt, got {}", config.maxSpawnAttempts));
    }
    if (config.initialCount < 0) {
        throw std::invalid_argument(std::format("Director initial count must be >= 0, got {}", config.initialCount));
    }
    if (config.typeWeights.empty()) {
        throw std::invalid_argument("Director needs at least one type weight breakpoint");
    }
    for (size_t i = 0; i < config.typeWeights.size(); ++i) {
        const TypeWeightBreakpoint& bp = config.typeWeights[i];
        if (!isNonNegative(bp.time) || (i > 0 && bp.time <= config.typeWeights[i - 1].time)) {
            throw std::invalid_argument(std::format(
                "Director type weight breakpoint {} at {}s is negative or not ascending", i, bp.time));
        }
        float sum = 0.0f;
        for (float w : bp.weights) {
            if (!isNonNegative(w)) {
                throw std::invalid_argument(std::format(
                    "Director type weight breakpoint {} has a negative or non-finite weight", i));
            }
            sum += w;
        }
        if (sum <= 0.0f) {
            throw std::invalid_argument(std::format("Director type weight breakpoint {} sums to zero", i));
        }
    }

    m_directive.weights = typeWeights(0.0f);
    m_directive.targetCount = targetCount(0.0f);
    m_directive.spawnInterval = spawnInterval(0.0f);
    m_directive.spawnIntervalRemaining = m_timer;
}

int Director::targetCount(float elapsedSeconds) const {
    const double t = std::max(0.0, static_cast<double>(elapsedSeconds));
    const double grown = static_cast<double>(m_config.baseCount) +
                         std::floor(static_cast<double>(m_config.countRate) * t);
    return static_cast<int>(std::min(static_cast<double>(m_config.maxCount), grown));
}

std::array<float, ZOMBIE_TYPE_COUNT> Director::typeWeights(float elapsedSeconds) const {
    const auto& breakpoints = m_config.typeWeights;
    std::array<float, ZOMBIE_TYPE_COUNT> weights = breakpoints.front().weights;

    if (elapsedSeconds >= breakpoints.back().time) {
        weights = breakpoints.back().weights;
    } else {
        for (size_t i = 1; i < breakpoints.size(); ++i) {
            const TypeWeightBreakpoint& lo = breakpoints[i - 1];
            const TypeWeightBreakpoint& hi = breakpoints[i];
            if (elapsedSeconds < hi.time) {
                const float span = hi.time - lo.time;
                const float t = std::clamp((elapsedSeconds - lo.time) / span, 0.0f, 1.0f);
                for (size_t k = 0; k < ZOMBIE_TYPE_COUNT; ++k) {
                    weights[k] = lo.weights[k] + (hi.weights[k] - lo.weights[k]) * t;
                }
                break;
            }
        }
    }

    const float sum = std::accumulate(weights.begin(), weights.end(), 0.0f);
    for (float& w : weights) {
        w = std::max(0.0f, w / sum);
    }
    return weights;
}

float Director::spawnInterval(float elapsedSeconds) const {
    const float steps = std::floor(std::max(0.0f, elapsedSeconds) / m_config.intervalDecayPeriod);
    return std::max(m_config.minSpawnInterval, m_config.initialSpawnInterval - m_config.intervalDecay * steps);
}

ZombieType Director::drawType(const std::array<float, ZOMBIE_TYPE_COUNT>& weights, Random& random) const {
    const float roll = random.unit();
    float cumulative = 0.0f;
    size_t lastNonZero = 0;
    for (size_t k = 0; k < ZOMBIE_TYPE_COUNT; ++k) {
        if (weights[k] <= 0.0f) continue;
        lastNonZero = k;
        cumulative += weights[k];
        if (roll < cumulative) {
            return static_cast<ZombieType>(k);
        }
    }
    // Rounding left the roll just past the last bucket
    return static_cast<ZombieType>(lastNonZero);
}

Vector2D Director::sampleRing(Random& random, const Vector2D& center) const {
    const float angle = random.uniform(0.0f, 2.0f * Geometry::PI);
    const float distance = random.uniform(m_config.minSpawnRadius, m_config.maxSpawnRadius);
    return center + Vector2D(std::cos(angle), std::sin(angle)) * distance;
}

Vector2D Director::clampToMap(const ObstacleSet& obstacles, const Vector2D& point) const {
    return obstacles.clampToBounds(point, m_config.spawnClearance);
}

bool Director::isValidSpawnPoint(const SimulationContext& context, const Vector2D& point,
                                 const Vector2D& playerPos, const std::vector<SpawnRequest>& pending) const {
    if (!point.isFinite()) {
        return false;
    }
    if (Vector2D::distance(point, playerPos) < m_config.minDistanceFromPlayer) {
        return false;
    }
    if (context.obstacles.isOutOfBounds(point)) {
        return false;
    }
    if (context.obstacles.overlapsCircle(point, m_config.spawnClearance)) {
        return false;
    }

    const float separationSq = m_config.minSpawnSeparation * m_config.minSpawnSeparation;
    bool crowded = false;
    context.entities.forEachAlive(EntityKind::Zombie, [&](const Entity& zombie) {
        if (!crowded && Vector2D::distanceSquared(zombie.position, point) < separationSq) {
            crowded = true;
        }
    });
    if (crowded) {
        return false;
    }
    for (const SpawnRequest& request : pending) {
        if (Vector2D::distanceSquared(request.position, point) < separationSq) {
            return false;
        }
    }
    return true;
}

std::optional<Vector2D> Director::findSpawnPoint(const SimulationContext& context, const Vector2D& playerPos,
                                                 const std::vector<SpawnRequest>& pending) const {
    for (int attempt = 0; attempt < m_config.maxSpawnAttempts; ++attempt) {
        const Vector2D candidate = clampToMap(context.obstacles, sampleRing(context.random, playerPos));
        if (isValidSpawnPoint(context, candidate, playerPos, pending)) {
            return candidate;
        }
    }
    return std::nullopt;
}

const SpawnDirective& Director::update(SimulationContext& context, const ScoreSource& score,
                                       std::vector<SpawnRequest>& out) {
    const float elapsed = score.elapsedSeconds();

    m_directive.elapsedSeconds = elapsed;
    m_directive.score = score.score();
    m_directive.weights = typeWeights(elapsed);
    m_directive.targetCount = targetCount(elapsed);
    m_directive.spawnInterval = spawnInterval(elapsed);

    if (m_directive.targetCount != m_lastTarget) {
        DIRECTOR_INFO(std::format("Target population {} at {:.1f}s", m_directive.targetCount, elapsed));
        m_lastTarget = m_directive.targetCount;
    }

    m_timer -= context.deltaTime;
    if (m_timer <= 0.0f) {
        const size_t live = context.entities.countAlive(EntityKind::Zombie) + out.size();
        const Entity* player = context.entities.find(context.player);

        if (live >= static_cast<size_t>(m_directive.targetCount)) {
            // At the target: hold the timer expired so the next free slot fills at once
            m_timer = 0.0f;
        } else if (!player || !player->alive) {
            m_timer = m_directive.spawnInterval;
        } else {
            auto point = findSpawnPoint(context, player->position, out);
            if (point) {
                const ZombieType type = drawType(m_directive.weights, context.random);
                out.push_back(SpawnRequest{type, *point});
                DIRECTOR_DEBUG(std::format("Requesting {} zombie at ({:.1f}, {:.1f}), {} live of {}",
                                           toString(type), point->getX(), point->getY(), live,
                                           m_directive.targetCount));
            } else {
                ++m_skippedCycles;
                DIRECTOR_WARN(std::format("No valid spawn point after {} attempts around ({:.1f}, {:.1f}), skipping cycle",
                                          m_config.maxSpawnAttempts, player->position.getX(),
                                          player->position.getY()));
            }
            m_timer = m_directive.spawnInterval;
        }
    }

    m_directive.spawnIntervalRemaining = std::max(0.0f, m_timer);
    return m_directive;
}

void Director::seedInitialWave(SimulationContext& context, std::vector<SpawnRequest>& out) {
    const Entity* player = context.entities.find(context.player);
    if (!player || !player->alive) {
        DIRECTOR_WARN("No player registered, initial wave skipped");
        return;
    }

    const auto weights = typeWeights(0.0f);
    const auto& bounds = context.obstacles.worldBounds();
    int placed = 0;

    for (int i = 0; i < m_config.initialCount; ++i) {
        for (int attempt = 0; attempt < m_config.maxSpawnAttempts; ++attempt) {
            // Anywhere on the map when bounds are known, otherwise on the ring
            Vector2D candidate;
            if (bounds) {
                candidate = Vector2D(context.random.uniform(bounds->left(), bounds->right()),
                                     context.random.uniform(bounds->top(), bounds->bottom()));
                candidate = clampToMap(context.obstacles, candidate);
            } else {
                candidate = sampleRing(context.random, player->position);
            }

            if (isValidSpawnPoint(context, candidate, player->position, out)) {
                out.push_back(SpawnRequest{drawType(weights, context.random), candidate});
                ++placed;
                break;
            }
        }
    }

    if (placed < m_config.initialCount) {
        DIRECTOR_WARN(std::format("Initial wave placed {} of {} zombies", placed, m_config.initialCount));
    } else {
        DIRECTOR_INFO(std::format("Initial wave of {} zombies placed", placed));
    }
}

} // namespace Deadlock

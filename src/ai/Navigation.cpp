/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/Navigation.hpp"
#include "collisions/Geometry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Deadlock {

const char* toString(NavMode mode) {
    switch (mode) {
    case NavMode::Seeking: return "Seeking";
    case NavMode::Probing: return "Probing";
    case NavMode::Attacking: return "Attacking";
    }
    return "Unknown";
}

Navigation::Navigation(const NavigationConfig& config) : m_config(config) {
    if (!std::isfinite(config.stuckEpsilon) || config.stuckEpsilon < 0.0f) {
        throw std::invalid_argument(std::format("Navigation stuckEpsilon must be >= 0, got {}", config.stuckEpsilon));
    }
    if (config.stuckTicks < 1) {
        throw std::invalid_argument(std::format("Navigation stuckTicks must be >= 1, got {}", config.stuckTicks));
    }
    if (!std::isfinite(config.probeDistance) || config.probeDistance <= 0.0f) {
        throw std::invalid_argument(std::format("Navigation probeDistance must be positive, got {}", config.probeDistance));
    }
    if (!std::isfinite(config.probeTimeout) || config.probeTimeout <= 0.0f) {
        throw std::invalid_argument(std::format("Navigation probeTimeout must be positive, got {}", config.probeTimeout));
    }
    if (!std::isfinite(config.probeTolerance) || config.probeTolerance < 0.0f) {
        throw std::invalid_argument(std::format("Navigation probeTolerance must be >= 0, got {}", config.probeTolerance));
    }
    if (config.probeAngles.empty()) {
        throw std::invalid_argument("Navigation needs at least one probe angle");
    }
    for (float angle : config.probeAngles) {
        if (!std::isfinite(angle)) {
            throw std::invalid_argument("Navigation probe angles must be finite");
        }
    }
}

void Navigation::attach(EntityRegistry& registry) {
    registry.addRemovalListener([this](const Entity& entity) { onEntityRemoved(entity); });
}

void Navigation::onEntityRemoved(const Entity& entity) {
    if (entity.kind == EntityKind::Zombie) {
        m_states.erase(entity.id);
    }
}

std::optional<NavMode> Navigation::getMode(EntityID zombie) const {
    auto it = m_states.find(zombie);
    if (it == m_states.end()) {
        return std::nullopt;
    }
    return it->second.mode;
}

const ZombieAIState* Navigation::getState(EntityID zombie) const {
    auto it = m_states.find(zombie);
    return it == m_states.end() ? nullptr : &it->second;
}

bool Navigation::isHeadingClear(const ObstacleSet& obstacles, const Entity& zombie,
                                const Vector2D& heading) const {
    const Vector2D probe = zombie.position + heading * m_config.probeDistance;
    return !obstacles.overlapsCircle(probe, zombie.radius, m_config.probeTolerance);
}

std::optional<Vector2D> Navigation::sampleProbeHeading(const ObstacleSet& obstacles, const Entity& zombie,
                                                       const Vector2D& desired) const {
    for (float degrees : m_config.probeAngles) {
        const Vector2D candidate = desired.rotated(Geometry::degToRad(degrees));
        if (isHeadingClear(obstacles, zombie, candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

void Navigation::enterProbing(const ObstacleSet& obstacles, const Entity& zombie, ZombieAIState& state,
                              const Vector2D& desired) {
    state.mode = NavMode::Probing;
    state.probeTimer = m_config.probeTimeout;
    state.stuckTicks = 0;
    auto heading = sampleProbeHeading(obstacles, zombie, desired);
    state.probeHeading = heading ? *heading : Vector2D(0, 0);

    NAV_DEBUG(std::format("Zombie {} stuck at ({}, {}), probing", zombie.id,
                          zombie.position.getX(), zombie.position.getY()));
}

void Navigation::update(SimulationContext& context, DamageSink& damage) {
    const float dt = context.deltaTime;
    Entity* player = context.entities.find(context.player);
    if (player && (!player->alive || player->kind != EntityKind::Player)) {
        player = nullptr;
    }

    context.entities.forEachAlive(EntityKind::Zombie, [&](Entity& zombie) {
        ZombieAIState& state = m_states[zombie.id];
        state.tickStart = zombie.position;
        state.attackCooldown = std::max(0.0f, state.attackCooldown - dt);
        state.engaged = false;
        state.hasTarget = player != nullptr;

        // An attack lasts exactly one tick
        if (state.mode == NavMode::Attacking) {
            state.mode = NavMode::Seeking;
        }

        if (!player) {
            zombie.velocity = Vector2D(0, 0);
            return;
        }

        const Vector2D toPlayer = player->position - zombie.position;
        const Vector2D desired = toPlayer.normalized();
        const float speed = zombie.zombie.speed;

        switch (state.mode) {
        case NavMode::Seeking: {
            const float surfaceDistance = toPlayer.length() - zombie.radius - player->radius;
            state.engaged = surfaceDistance <= zombie.zombie.attackRange;
            if (state.engaged && state.attackCooldown <= 0.0f) {
                state.mode = NavMode::Attacking;
                state.attackCooldown = zombie.zombie.attackCooldown;
                damage.applyZombieAttack(zombie, *player, zombie.zombie.contactDamage);
            }
            zombie.velocity = desired * speed;
            break;
        }
        case NavMode::Probing: {
            state.probeTimer -= dt;
            if (state.probeTimer <= 0.0f) {
                NAV_DEBUG(std::format("Zombie {} probe timed out", zombie.id));
                state.mode = NavMode::Seeking;
                state.stuckTicks = 0;
                state.probeHeading = Vector2D(0, 0);
                zombie.velocity = desired * speed;
                break;
            }

            // Keep the held heading while it stays clear, otherwise resample
            const bool holding = state.probeHeading.lengthSquared() > 0.0f &&
                                 isHeadingClear(context.obstacles, zombie, state.probeHeading);
            if (!holding) {
                auto heading = sampleProbeHeading(context.obstacles, zombie, desired);
                state.probeHeading = heading ? *heading : Vector2D(0, 0);
            }
            zombie.velocity = state.probeHeading * speed;
            break;
        }
        case NavMode::Attacking:
            break;
        }
    });
}

void Navigation::evaluateProgress(const SimulationContext& context) {
    const Entity* player = context.entities.find(context.player);

    context.entities.forEachAlive(EntityKind::Zombie, [&](const Entity& zombie) {
        auto it = m_states.find(zombie.id);
        if (it == m_states.end()) return;
        ZombieAIState& state = it->second;

        const float displacement = Vector2D::distance(zombie.position, state.tickStart);
        const bool moved = displacement >= m_config.stuckEpsilon;

        if (!state.hasTarget || !player) {
            state.stuckTicks = 0;
            return;
        }
        const Vector2D desired = (player->position - zombie.position).normalized();

        switch (state.mode) {
        case NavMode::Seeking:
            // Pressing against the player is not being stuck
            if (moved || state.engaged) {
                state.stuckTicks = 0;
            } else if (++state.stuckTicks >= m_config.stuckTicks) {
                enterProbing(context.obstacles, zombie, state, desired);
            }
            break;
        case NavMode::Probing:
            if (moved && isHeadingClear(context.obstacles, zombie, desired)) {
                NAV_DEBUG(std::format("Zombie {} path clear, seeking again", zombie.id));
                state.mode = NavMode::Seeking;
                state.stuckTicks = 0;
                state.probeHeading = Vector2D(0, 0);
            }
            break;
        case NavMode::Attacking:
            state.stuckTicks = 0;
            break;
        }
    });
}

} // namespace Deadlock

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionWorld.hpp"
#include "collisions/Geometry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <boost/container/small_vector.hpp>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Deadlock {

const char* toString(CollisionKind kind) {
    switch (kind) {
    case CollisionKind::EntityEntity: return "EntityEntity";
    case CollisionKind::EntityObstacle: return "EntityObstacle";
    case CollisionKind::ProjectileHit: return "ProjectileHit";
    case CollisionKind::ExplosionHit: return "ExplosionHit";
    case CollisionKind::PickupContact: return "PickupContact";
    }
    return "Unknown";
}

CollisionWorld::CollisionWorld(const CollisionConfig& config)
    : m_config(config), m_grid(config.cellSize > 0.0f ? config.cellSize : 64.0f) {
    if (!std::isfinite(config.cellSize) || config.cellSize <= 0.0f) {
        throw std::invalid_argument(std::format("Collision cell size must be positive, got {}", config.cellSize));
    }
    if (config.solverIterations < 1) {
        throw std::invalid_argument(std::format("Collision solver needs at least one iteration, got {}",
                                                config.solverIterations));
    }
    if (!std::isfinite(config.overlapEpsilon) || config.overlapEpsilon < 0.0f) {
        throw std::invalid_argument(std::format("Collision overlap epsilon must be >= 0, got {}",
                                                config.overlapEpsilon));
    }
}

const std::vector<CollisionEvent>& CollisionWorld::step(EntityRegistry& registry,
                                                        const ObstacleSet& obstacles) {
    rebuild(registry);
    resolvePairs(registry);
    resolveObstacles(registry, obstacles);
    testProjectiles(registry, obstacles);
    detectPickups(registry);
    return m_events;
}

void CollisionWorld::rebuild(const EntityRegistry& registry) {
    m_events.clear();
    m_pairs.clear();
    m_reportedPairs.clear();

    m_maxRadius = 0.0f;
    for (const auto& [id, entity] : registry.entities()) {
        if (entity.alive && entity.has(CAP_COLLIDABLE)) {
            m_maxRadius = std::max(m_maxRadius, entity.radius);
        }
    }

    // Neighbourhood queries are only exhaustive when a cell spans a diameter
    const float effectiveCell = std::max(m_config.cellSize, 2.0f * m_maxRadius);
    if (effectiveCell != m_grid.getCellSize()) {
        COLLISION_DEBUG(std::format("Grid cell size raised to {} for radius {}", effectiveCell, m_maxRadius));
        m_grid.setCellSize(effectiveCell);
    }
    rebucket(registry);
}

void CollisionWorld::rebucket(const EntityRegistry& registry) {
    m_grid.clear();
    for (const auto& [id, entity] : registry.entities()) {
        if (entity.alive && entity.has(CAP_COLLIDABLE)) {
            m_grid.insertPoint(id, entity.position);
        }
    }
}

void CollisionWorld::queryNeighbors(const Entity& entity, std::vector<EntityID>& out) const {
    m_grid.queryNeighbors(entity.position, out);
    out.erase(std::remove(out.begin(), out.end(), entity.id), out.end());
}

void CollisionWorld::collectPairs(const EntityRegistry& registry) {
    m_pairs.clear();
    for (const auto& [id, entity] : registry.entities()) {
        if (!entity.isSolid()) continue;

        queryNeighbors(entity, m_candidates);
        for (EntityID other : m_candidates) {
            if (other <= id) continue; // each unordered pair once, from its smaller id
            const Entity* candidate = registry.find(other);
            if (candidate && candidate->isSolid()) {
                m_pairs.emplace_back(id, other);
            }
        }
    }
    std::sort(m_pairs.begin(), m_pairs.end());
    m_pairs.erase(std::unique(m_pairs.begin(), m_pairs.end()), m_pairs.end());
}

void CollisionWorld::resolvePairs(EntityRegistry& registry) {
    for (int iteration = 0; iteration < m_config.solverIterations; ++iteration) {
        // Pushes move bodies across cells, so candidates are gathered afresh each pass
        if (iteration > 0) {
            rebucket(registry);
        }
        collectPairs(registry);

        bool anyOverlap = false;
        for (const auto& [lowId, highId] : m_pairs) {
            Entity* a = registry.find(lowId);
            Entity* b = registry.find(highId);
            if (!a || !b || !a->alive || !b->alive) continue;

            const Vector2D delta = b->position - a->position;
            const float reach = a->radius + b->radius;
            const float distSq = delta.lengthSquared();
            if (distSq >= reach * reach) continue;

            const float dist = std::sqrt(distSq);
            const float overlap = reach - dist;
            if (overlap <= m_config.overlapEpsilon) continue;

            const Vector2D normal = dist > 1e-6f ? delta / dist
                                                 : Geometry::tieBreakDirection(lowId, highId);

            // Inverse-mass share: the lighter body moves further
            const float invA = 1.0f / a->mass;
            const float invB = 1.0f / b->mass;
            const float invSum = invA + invB;
            a->position -= normal * (overlap * invA / invSum);
            b->position += normal * (overlap * invB / invSum);
            anyOverlap = true;

            // One event per pair per tick, from the first pass that separated it
            if (m_reportedPairs.insert(std::make_pair(lowId, highId)).second) {
                m_events.push_back(CollisionEvent{lowId, highId, CollisionKind::EntityEntity,
                                                  normal * overlap, a->position + normal * a->radius});
            }
        }

        if (!anyOverlap) {
            return;
        }
    }

    rebucket(registry);
    collectPairs(registry);
    COLLISION_WARN(std::format("Pair solver hit its {} pass cap, {} candidate pairs left",
                               m_config.solverIterations, m_pairs.size()));
}

void CollisionWorld::resolveObstacles(EntityRegistry& registry, const ObstacleSet& obstacles) {
    for (auto& [id, entity] : registry.entities()) {
        if (!entity.isSolid()) continue;

        entity.position = obstacles.clampToBounds(entity.position, entity.radius);
        if (obstacles.empty()) continue;

        boost::container::small_vector<size_t, 4> reported;
        for (int iteration = 0; iteration < m_config.solverIterations; ++iteration) {
            bool moved = false;
            obstacles.query(AABB(entity.position.getX(), entity.position.getY(),
                                 entity.radius, entity.radius),
                            m_obstacleCandidates);

            for (size_t index : m_obstacleCandidates) {
                const Vector2D fallback = Geometry::tieBreakDirection(id, static_cast<EntityID>(index) + 1);
                auto push = obstacles[index].penetration(entity.position, entity.radius, fallback);
                if (!push || push->length() <= m_config.overlapEpsilon) continue;

                entity.position += *push;
                moved = true;

                if (std::find(reported.begin(), reported.end(), index) == reported.end()) {
                    reported.push_back(index);
                    m_events.push_back(CollisionEvent{id, INVALID_ENTITY_ID,
                                                      CollisionKind::EntityObstacle, *push,
                                                      entity.position - push->normalized() * entity.radius,
                                                      index});
                }
            }

            if (!moved) break;
        }
    }
}

void CollisionWorld::testProjectiles(EntityRegistry& registry, const ObstacleSet& obstacles) {
    for (auto& [id, projectile] : registry.entities()) {
        if (!projectile.alive || projectile.kind != EntityKind::Projectile) continue;

        const Vector2D start = projectile.previousPosition;
        const Vector2D end = projectile.position;
        const Vector2D travel = end - start;
        const float travelLength = travel.length();
        const float probeRadius = projectile.radius;

        // Earliest damageable entity along the sweep; centers may have shifted
        // by up to one diameter during resolution, hence the extra slack
        float entityT = 2.0f;
        EntityID entityHit = INVALID_ENTITY_ID;
        const AABB sweep = AABB::fromMinMax(start, end).inflated(2.0f * m_maxRadius + probeRadius);
        m_grid.query(sweep, m_candidates);
        for (EntityID candidateId : m_candidates) {
            if (candidateId == id || candidateId == projectile.projectile.owner) continue;
            const Entity* target = registry.find(candidateId);
            if (!target || !target->alive || !target->has(CAP_DAMAGEABLE)) continue;

            auto t = Geometry::segmentCircleEntry(start, end, target->position, target->radius + probeRadius);
            if (t && (*t < entityT || (*t == entityT && candidateId < entityHit))) {
                entityT = *t;
                entityHit = candidateId;
            }
        }

        float obstacleT = 2.0f;
        size_t obstacleHit = 0;
        bool blocked = false;
        obstacles.query(AABB::fromMinMax(start, end).inflated(probeRadius), m_obstacleCandidates);
        for (size_t index : m_obstacleCandidates) {
            const Obstacle& obstacle = obstacles[index];
            if (!obstacle.blocksProjectiles) continue;
            auto t = obstacle.segmentEntry(start, end, probeRadius);
            if (t && *t < obstacleT) {
                obstacleT = *t;
                obstacleHit = index;
                blocked = true;
            }
        }

        const Vector2D direction = travelLength > 1e-6f ? travel / travelLength : Vector2D(0, 0);

        if (entityHit != INVALID_ENTITY_ID && entityT <= obstacleT) {
            const Vector2D impact = start + travel * entityT;
            m_events.push_back(CollisionEvent{id, entityHit, CollisionKind::ProjectileHit,
                                              direction * (travelLength * (1.0f - entityT)), impact});
            projectile.position = impact;
            registry.markForRemoval(id);
            if (projectile.projectile.explosionRadius > 0.0f) {
                explode(registry, projectile, impact, entityHit);
            }
            continue;
        }

        if (blocked) {
            const Vector2D impact = start + travel * obstacleT;
            m_events.push_back(CollisionEvent{id, INVALID_ENTITY_ID, CollisionKind::EntityObstacle,
                                              direction * (travelLength * (1.0f - obstacleT)), impact,
                                              obstacleHit});
            projectile.position = impact;
            registry.markForRemoval(id);
            if (projectile.projectile.explosionRadius > 0.0f) {
                explode(registry, projectile, impact, INVALID_ENTITY_ID);
            }
            continue;
        }

        projectile.projectile.remainingRange -= travelLength;
        if (projectile.projectile.remainingRange <= 0.0f || obstacles.isOutOfBounds(end)) {
            registry.markForRemoval(id);
        }
    }
}

void CollisionWorld::explode(const EntityRegistry& registry, const Entity& projectile,
                             const Vector2D& impact, EntityID directTarget) {
    const float blastRadius = projectile.projectile.explosionRadius;
    const float reach = blastRadius + 2.0f * m_maxRadius;
    m_grid.query(AABB(impact.getX(), impact.getY(), reach, reach), m_candidates);
    std::sort(m_candidates.begin(), m_candidates.end());

    size_t victims = 0;
    for (EntityID candidateId : m_candidates) {
        if (candidateId == directTarget || candidateId == projectile.projectile.owner) continue;
        const Entity* target = registry.find(candidateId);
        if (!target || !target->alive || !target->has(CAP_DAMAGEABLE)) continue;

        const float limit = blastRadius + target->radius;
        if (Vector2D::distanceSquared(target->position, impact) <= limit * limit) {
            m_events.push_back(CollisionEvent{projectile.id, candidateId, CollisionKind::ExplosionHit,
                                              target->position - impact, impact});
            ++victims;
        }
    }

    COLLISION_DEBUG(std::format("Projectile {} exploded at ({}, {}) catching {} entities",
                             projectile.id, impact.getX(), impact.getY(), victims));
}

void CollisionWorld::detectPickups(const EntityRegistry& registry) {
    const float multiplier = m_config.pickupRadiusMultiplier;

    registry.forEachAlive(EntityKind::Player, [&](const Entity& player) {
        const float reach = multiplier * (player.radius + m_maxRadius);
        m_grid.query(AABB(player.position.getX(), player.position.getY(), reach, reach), m_candidates);
        std::sort(m_candidates.begin(), m_candidates.end());

        for (EntityID candidateId : m_candidates) {
            const Entity* pickup = registry.find(candidateId);
            if (!pickup || !pickup->alive || pickup->kind != EntityKind::Pickup) continue;

            const float contact = multiplier * (player.radius + pickup->radius);
            if (Vector2D::distanceSquared(player.position, pickup->position) <= contact * contact) {
                m_events.push_back(CollisionEvent{player.id, candidateId, CollisionKind::PickupContact,
                                                  Vector2D(0, 0), pickup->position});
            }
        }
    });
}

} // namespace Deadlock

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_WORLD_HPP
#define COLLISION_WORLD_HPP

#include "collisions/CollisionConfig.hpp"
#include "collisions/CollisionEvent.hpp"
#include "collisions/ObstacleSet.hpp"
#include "collisions/SpatialHash.hpp"
#include "entities/EntityRegistry.hpp"
#include <boost/container/flat_set.hpp>
#include <utility>
#include <vector>

namespace Deadlock {

/**
 * @brief Per-tick broad phase, overlap resolution and projectile sweeps.
 *
 * Every tick runs rebuild -> resolvePairs -> resolveObstacles ->
 * testProjectiles -> detectPickups (step() does all five). All per-tick
 * buffers are cleared at rebuild; nothing carries over between ticks.
 *
 * Entities are never removed here. Projectiles that hit, expire or leave the
 * map are only marked for removal; the registry erases them at the tick
 * boundary.
 */
class CollisionWorld {
public:
    explicit CollisionWorld(const CollisionConfig& config = CollisionConfig{});

    /**
     * @brief Runs the full collision pipeline for one tick
     * @return events produced this tick, valid until the next step/rebuild
     */
    const std::vector<CollisionEvent>& step(EntityRegistry& registry, const ObstacleSet& obstacles);

    // Clears per-tick state and re-buckets every live collidable entity
    void rebuild(const EntityRegistry& registry);

    // Candidates sharing entity's cell or one of its 8 neighbours (excludes entity)
    void queryNeighbors(const Entity& entity, std::vector<EntityID>& out) const;

    /**
     * @brief Relaxes overlapping solid pairs until none overlaps by more than
     *        overlapEpsilon, or solverIterations passes have run
     *
     * Each pass re-buckets moved bodies and walks the sorted pair list.
     * A pair emits one EntityEntity event, from the first pass that pushes it.
     */
    void resolvePairs(EntityRegistry& registry);
    void resolveObstacles(EntityRegistry& registry, const ObstacleSet& obstacles);
    void testProjectiles(EntityRegistry& registry, const ObstacleSet& obstacles);
    void detectPickups(const EntityRegistry& registry);

    const std::vector<CollisionEvent>& getEvents() const { return m_events; }

    // Sorted candidate pairs gathered by the last pass of resolvePairs()
    const std::vector<std::pair<EntityID, EntityID>>& getPairs() const { return m_pairs; }

    float getEffectiveCellSize() const { return m_grid.getCellSize(); }
    const CollisionConfig& getConfig() const { return m_config; }

private:
    void rebucket(const EntityRegistry& registry);
    void collectPairs(const EntityRegistry& registry);
    void explode(const EntityRegistry& registry, const Entity& projectile,
                 const Vector2D& impact, EntityID directTarget);

    CollisionConfig m_config;
    SpatialHash m_grid;
    float m_maxRadius{0.0f};

    std::vector<std::pair<EntityID, EntityID>> m_pairs;
    boost::container::flat_set<std::pair<EntityID, EntityID>> m_reportedPairs;
    std::vector<CollisionEvent> m_events;
    std::vector<EntityID> m_candidates;
    std::vector<size_t> m_obstacleCandidates;
};

} // namespace Deadlock

#endif // COLLISION_WORLD_HPP

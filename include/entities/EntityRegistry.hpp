/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

#include "entities/Entity.hpp"
#include <boost/container/flat_map.hpp>
#include <functional>
#include <vector>

namespace Deadlock {

/**
 * @brief Owns every live entity of one simulation.
 *
 * Storage is a flat_map keyed by id, so iteration is always in ascending id
 * order regardless of insertion history. Ids come from a per-registry
 * counter and are never reused.
 *
 * Removal is two-phase: markForRemoval() flags the entity dead immediately
 * (systems skip it) but the record stays until flushRemovals() runs at the
 * tick boundary, so every system within a tick sees the same entity set.
 *
 * Entity pointers returned by find() are invalidated by create() and
 * flushRemovals().
 */
class EntityRegistry {
public:
    using Storage = boost::container::flat_map<EntityID, Entity>;
    using RemovalListener = std::function<void(const Entity&)>;

    EntityRegistry() = default;

    /**
     * @brief Validates and adopts an entity, assigning its id and capabilities
     * @throws std::invalid_argument on non-finite position/velocity, negative
     *         or non-finite radius, non-positive mass or non-finite health
     */
    EntityID create(Entity entity);

    Entity* find(EntityID id);
    const Entity* find(EntityID id) const;
    bool contains(EntityID id) const { return m_entities.find(id) != m_entities.end(); }

    /**
     * @brief Flags an entity dead; the record is erased at the next flush
     * @return false if the id is unknown or already pending
     */
    bool markForRemoval(EntityID id);

    /**
     * @brief Erases every pending entity and notifies listeners
     * @return ids removed, ascending
     */
    std::vector<EntityID> flushRemovals();

    bool hasPendingRemovals() const { return !m_pendingRemoval.empty(); }

    void addRemovalListener(RemovalListener listener) {
        m_removalListeners.push_back(std::move(listener));
    }

    size_t size() const { return m_entities.size(); }
    size_t countAlive(EntityKind kind) const;

    Storage& entities() { return m_entities; }
    const Storage& entities() const { return m_entities; }

    template <typename Fn>
    void forEachAlive(EntityKind kind, Fn&& fn) {
        for (auto& [id, entity] : m_entities) {
            if (entity.alive && entity.kind == kind) {
                fn(entity);
            }
        }
    }

    template <typename Fn>
    void forEachAlive(EntityKind kind, Fn&& fn) const {
        for (const auto& [id, entity] : m_entities) {
            if (entity.alive && entity.kind == kind) {
                fn(entity);
            }
        }
    }

    EntityID peekNextId() const { return m_nextId; }

private:
    static void validate(const Entity& entity);

    Storage m_entities;
    std::vector<EntityID> m_pendingRemoval;
    std::vector<RemovalListener> m_removalListeners;
    EntityID m_nextId{1};
};

} // namespace Deadlock

#endif // ENTITY_REGISTRY_HPP

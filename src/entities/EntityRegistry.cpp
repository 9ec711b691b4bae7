/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/EntityRegistry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Deadlock {

void EntityRegistry::validate(const Entity& entity) {
    if (!entity.position.isFinite()) {
        throw std::invalid_argument(std::format(
            "{} entity has non-finite position ({}, {})", toString(entity.kind),
            entity.position.getX(), entity.position.getY()));
    }
    if (!entity.velocity.isFinite()) {
        throw std::invalid_argument(std::format(
            "{} entity has non-finite velocity ({}, {})", toString(entity.kind),
            entity.velocity.getX(), entity.velocity.getY()));
    }
    if (!std::isfinite(entity.radius) || entity.radius < 0.0f) {
        throw std::invalid_argument(std::format(
            "{} entity has invalid radius {}", toString(entity.kind), entity.radius));
    }
    if (!std::isfinite(entity.mass) || entity.mass <= 0.0f) {
        throw std::invalid_argument(std::format(
            "{} entity has invalid mass {}", toString(entity.kind), entity.mass));
    }
    if (entity.health && !std::isfinite(*entity.health)) {
        throw std::invalid_argument(std::format(
            "{} entity has non-finite health", toString(entity.kind)));
    }
}

EntityID EntityRegistry::create(Entity entity) {
    validate(entity);

    entity.id = m_nextId++;
    entity.capabilities = EntityTraits::capabilitiesFor(entity.kind);
    entity.previousPosition = entity.position;
    entity.alive = true;

    if (EntityTraits::hasHealth(entity.kind)) {
        if (!entity.health) {
            entity.health = 100.0f;
        }
        if (!entity.maxHealth) {
            entity.maxHealth = entity.health;
        }
    } else {
        entity.health.reset();
        entity.maxHealth.reset();
    }

    const EntityID id = entity.id;
    // Ids are monotonic, so this always appends at the back of the flat_map
    m_entities.emplace_hint(m_entities.end(), id, std::move(entity));
    return id;
}

Entity* EntityRegistry::find(EntityID id) {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

const Entity* EntityRegistry::find(EntityID id) const {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : &it->second;
}

bool EntityRegistry::markForRemoval(EntityID id) {
    auto it = m_entities.find(id);
    if (it == m_entities.end() || !it->second.alive) {
        return false;
    }
    it->second.alive = false;
    m_pendingRemoval.push_back(id);
    return true;
}

std::vector<EntityID> EntityRegistry::flushRemovals() {
    std::vector<EntityID> removed;
    if (m_pendingRemoval.empty()) {
        return removed;
    }

    std::sort(m_pendingRemoval.begin(), m_pendingRemoval.end());
    removed.reserve(m_pendingRemoval.size());

    for (EntityID id : m_pendingRemoval) {
        auto it = m_entities.find(id);
        if (it == m_entities.end()) {
            continue;
        }
        for (const auto& listener : m_removalListeners) {
            listener(it->second);
        }
        m_entities.erase(it);
        removed.push_back(id);
    }
    m_pendingRemoval.clear();

    ENTITY_DEBUG(std::format("Removed {} entities, {} remain", removed.size(), m_entities.size()));
    return removed;
}

size_t EntityRegistry::countAlive(EntityKind kind) const {
    return static_cast<size_t>(std::count_if(
        m_entities.begin(), m_entities.end(),
        [kind](const auto& entry) { return entry.second.alive && entry.second.kind == kind; }));
}

} // namespace Deadlock

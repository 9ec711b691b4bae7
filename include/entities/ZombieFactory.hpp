/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ZOMBIE_FACTORY_HPP
#define ZOMBIE_FACTORY_HPP

#include "core/Collaborators.hpp"
#include "entities/EntityRegistry.hpp"
#include "entities/ZombieArchetypes.hpp"
#include "utils/Random.hpp"

namespace Deadlock {

/**
 * @brief EntityFactory that builds zombies from the archetype table
 *
 * Registry, random source and table are borrowed and must outlive the factory.
 */
class ZombieFactory : public EntityFactory {
public:
    ZombieFactory(EntityRegistry& registry, Random& random, const ZombieArchetypeTable& archetypes)
        : m_registry(registry), m_random(random), m_archetypes(archetypes) {}

    /**
     * @throws std::invalid_argument if the position is not finite
     */
    EntityID spawn(ZombieType type, const Vector2D& position) override;

    // Builds the unregistered record (speed drawn from the archetype range)
    Entity build(ZombieType type, const Vector2D& position);

private:
    EntityRegistry& m_registry;
    Random& m_random;
    const ZombieArchetypeTable& m_archetypes;
};

} // namespace Deadlock

#endif // ZOMBIE_FACTORY_HPP

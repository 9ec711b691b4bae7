/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NAVIGATION_HPP
#define NAVIGATION_HPP

#include "ai/NavigationConfig.hpp"
#include "ai/ZombieAIState.hpp"
#include "core/Collaborators.hpp"
#include "core/SimulationContext.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>

namespace Deadlock {

/**
 * @brief Local steering for every zombie: Seeking, Probing, Attacking.
 *
 * No graph search. A seeking zombie heads straight for the player; once its
 * net displacement stays under stuckEpsilon for stuckTicks consecutive ticks
 * it probes fixed angular offsets against the obstacle set and follows the
 * first clear one until the direct heading opens up again or probeTimeout
 * runs out.
 *
 * Each tick is split in two:
 *  - update() before integration: sets velocities, fires attacks
 *  - evaluateProgress() after collision: measures what movement survived
 *
 * AI state is created lazily on a zombie's first update and dropped through
 * the registry's removal listener when the zombie is erased.
 */
class Navigation {
public:
    /**
     * @throws std::invalid_argument on non-positive probe distance/timeout,
     *         stuckTicks < 1, negative epsilon or an empty probe angle list
     */
    explicit Navigation(const NavigationConfig& config = NavigationConfig{});

    // Hooks removal so AI state dies with its entity
    void attach(EntityRegistry& registry);

    void update(SimulationContext& context, DamageSink& damage);
    void evaluateProgress(const SimulationContext& context);

    std::optional<NavMode> getMode(EntityID zombie) const;
    const ZombieAIState* getState(EntityID zombie) const;
    size_t trackedCount() const { return m_states.size(); }

    void onEntityRemoved(const Entity& entity);

    const NavigationConfig& getConfig() const { return m_config; }

private:
    bool isHeadingClear(const ObstacleSet& obstacles, const Entity& zombie, const Vector2D& heading) const;

    // First candidate offset from desired whose probe is clear, or nullopt
    std::optional<Vector2D> sampleProbeHeading(const ObstacleSet& obstacles, const Entity& zombie,
                                               const Vector2D& desired) const;

    void enterProbing(const ObstacleSet& obstacles, const Entity& zombie, ZombieAIState& state,
                      const Vector2D& desired);

    NavigationConfig m_config;
    boost::container::flat_map<EntityID, ZombieAIState> m_states;
};

} // namespace Deadlock

#endif // NAVIGATION_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "ai/Navigation.hpp"
#include "collisions/CollisionWorld.hpp"
#include "collisions/ObstacleSet.hpp"
#include "combat/CombatResolver.hpp"
#include "combat/ScoreTracker.hpp"
#include "core/Collaborators.hpp"
#include "core/SimulationClock.hpp"
#include "core/SimulationConfig.hpp"
#include "director/Director.hpp"
#include "director/PickupSpawner.hpp"
#include "entities/EntityRegistry.hpp"
#include "entities/ZombieFactory.hpp"
#include "utils/Random.hpp"
#include <cstdint>
#include <vector>

namespace Deadlock {

// Everything a tick produced, for rendering, audio and tests
struct TickReport {
    uint64_t tick{0};
    std::vector<CollisionEvent> events;
    std::vector<SpawnRequest> spawnRequests;
    std::vector<EntityID> spawned;
    std::vector<EntityID> pickupsSpawned;
    std::vector<EntityID> removed;
    SpawnDirective directive;
    bool playerDead{false};
};

/**
 * @brief Owns one run of the simulation core and its fixed tick order.
 *
 * Per tick: Director -> spawn requests through the EntityFactory ->
 * PickupSpawner -> Navigation::update -> velocity integration -> CollisionWorld::step ->
 * Navigation::evaluateProgress -> CollisionEventSink -> removal flush.
 *
 * Built-in collaborators (ZombieFactory, CombatResolver, ScoreTracker) are
 * used unless replaced with the set* hooks. Replacements are borrowed and
 * must outlive the simulation.
 */
class Simulation {
public:
    /**
     * @throws std::invalid_argument if config fails validation or an obstacle
     *         is malformed
     */
    Simulation(const SimulationConfig& config, std::vector<Obstacle> obstacles);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * @brief Registers the player the zombies hunt
     * @throws std::invalid_argument if a live player already exists or the
     *         entity is malformed
     */
    EntityID spawnPlayer(const Vector2D& position, float radius = 14.0f, float health = 100.0f);

    // Director places and spawns the opening wave; call before the first tick
    std::vector<EntityID> seedInitialWave();

    // Runs exactly one fixed tick
    TickReport tick();

    // Feeds frameSeconds to the clock and runs every tick it yields
    size_t advance(double frameSeconds);

    // Measures wall time, runs due ticks, then paces the frame
    size_t runFrame();

    void pause() { m_clock.pause(); }
    void resume() { m_clock.resume(); }
    bool isPaused() const { return m_clock.isPaused(); }

    void setEntityFactory(EntityFactory* factory) { m_factory = factory ? factory : &m_zombieFactory; }
    void setDamageSink(DamageSink* sink) { m_damageSink = sink ? sink : &m_combat; }
    void setEventSink(CollisionEventSink* sink) { m_eventSink = sink ? sink : &m_combat; }
    void setScoreSource(const ScoreSource* source) { m_scoreSource = source ? source : &m_score; }

    EntityRegistry& entities() { return m_registry; }
    const EntityRegistry& entities() const { return m_registry; }
    const ObstacleSet& obstacles() const { return m_obstacles; }
    EntityID getPlayer() const { return m_player; }
    uint64_t getTickCount() const { return m_tickCount; }

    const SimulationConfig& getConfig() const { return m_config; }
    const SimulationClock& getClock() const { return m_clock; }
    const Navigation& getNavigation() const { return m_navigation; }
    const Director& getDirector() const { return m_director; }
    const PickupSpawner& getPickupSpawner() const { return m_pickupSpawner; }
    const CollisionWorld& getCollisionWorld() const { return m_collision; }
    const ScoreTracker& getScore() const { return m_score; }
    const CombatResolver& getCombat() const { return m_combat; }
    const TickReport& getLastReport() const { return m_lastReport; }
    Random& getRandom() { return m_random; }

private:
    SimulationContext makeContext();
    void integrate(float deltaTime);

    SimulationConfig m_config;
    SimulationClock m_clock;
    Random m_random;
    EntityRegistry m_registry;
    ObstacleSet m_obstacles;

    CollisionWorld m_collision;
    Navigation m_navigation;
    Director m_director;
    PickupSpawner m_pickupSpawner;

    ScoreTracker m_score;
    CombatResolver m_combat;
    ZombieFactory m_zombieFactory;

    EntityFactory* m_factory;
    DamageSink* m_damageSink;
    CollisionEventSink* m_eventSink;
    const ScoreSource* m_scoreSource;

    EntityID m_player{INVALID_ENTITY_ID};
    uint64_t m_tickCount{0};
    TickReport m_lastReport;
};

} // namespace Deadlock

#endif // SIMULATION_HPP

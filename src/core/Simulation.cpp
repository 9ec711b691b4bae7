/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Simulation.hpp"
#include "core/Logger.hpp"
#include "entities/Blueprints.hpp"
#include <format>
#include <stdexcept>

namespace Deadlock {

namespace {

const SimulationConfig& validated(const SimulationConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid simulation config: " + error);
    }
    return config;
}

AABB worldBounds(const SimulationConfig& config) {
    return AABB::fromMinMax(Vector2D(0.0f, 0.0f), Vector2D(config.worldWidth, config.worldHeight));
}

} // namespace

Simulation::Simulation(const SimulationConfig& config, std::vector<Obstacle> obstacles)
    : m_config(validated(config))
    , m_clock(m_config.clock)
    , m_random(m_config.seed)
    , m_obstacles(std::move(obstacles), worldBounds(m_config))
    , m_collision(m_config.collision)
    , m_navigation(m_config.navigation)
    , m_director(m_config.director)
    , m_pickupSpawner(m_config.pickups)
    , m_combat(m_score)
    , m_zombieFactory(m_registry, m_random, m_config.zombies)
    , m_factory(&m_zombieFactory)
    , m_damageSink(&m_combat)
    , m_eventSink(&m_combat)
    , m_scoreSource(&m_score)
{
    m_navigation.attach(m_registry);
    SIM_INFO(std::format("Simulation ready: {}x{} world, {} obstacles, seed {}",
                         m_config.worldWidth, m_config.worldHeight, m_obstacles.size(), m_config.seed));
}

EntityID Simulation::spawnPlayer(const Vector2D& position, float radius, float health) {
    if (const Entity* existing = m_registry.find(m_player); existing && existing->alive) {
        throw std::invalid_argument(std::format("Player {} is already alive", m_player));
    }
    m_player = m_registry.create(Blueprints::player(position, radius, health));
    SIM_INFO(std::format("Player {} spawned at ({}, {})", m_player, position.getX(), position.getY()));
    return m_player;
}

SimulationContext Simulation::makeContext() {
    return SimulationContext{m_registry, m_obstacles, m_random, m_player,
                             m_clock.getFixedTimestep(), m_tickCount};
}

std::vector<EntityID> Simulation::seedInitialWave() {
    SimulationContext context = makeContext();
    std::vector<SpawnRequest> requests;
    m_director.seedInitialWave(context, requests);

    std::vector<EntityID> spawned;
    spawned.reserve(requests.size());
    for (const SpawnRequest& request : requests) {
        spawned.push_back(m_factory->spawn(request.type, request.position));
    }
    return spawned;
}

void Simulation::integrate(float deltaTime) {
    for (auto& [id, entity] : m_registry.entities()) {
        if (!entity.alive || !entity.has(CAP_MOVABLE)) continue;
        entity.previousPosition = entity.position;
        entity.position += entity.velocity * deltaTime;
    }
}

TickReport Simulation::tick() {
    ++m_tickCount;
    const float dt = m_clock.getFixedTimestep();
    SimulationContext context = makeContext();

    TickReport report;
    report.tick = m_tickCount;

    m_score.advance(dt);

    report.directive = m_director.update(context, *m_scoreSource, report.spawnRequests);
    for (const SpawnRequest& request : report.spawnRequests) {
        report.spawned.push_back(m_factory->spawn(request.type, request.position));
    }
    if (auto point = m_pickupSpawner.update(context)) {
        report.pickupsSpawned.push_back(m_registry.create(
            Blueprints::pickup(*point, m_config.pickups.healAmount, m_config.pickups.radius)));
    }

    m_navigation.update(context, *m_damageSink);
    integrate(dt);

    report.events = m_collision.step(m_registry, m_obstacles);
    m_navigation.evaluateProgress(context);
    m_eventSink->consume(report.events, m_registry);

    report.removed = m_registry.flushRemovals();

    const Entity* player = m_registry.find(m_player);
    report.playerDead = m_player != INVALID_ENTITY_ID && (!player || !player->alive);

    if (m_tickCount % 600 == 0) {
        SIM_DEBUG(std::format("Tick {}: {} zombies (target {}), {} events, score {}", m_tickCount,
                              m_registry.countAlive(EntityKind::Zombie), report.directive.targetCount,
                              report.events.size(), m_scoreSource->score()));
    }

    m_lastReport = report;
    return report;
}

size_t Simulation::advance(double frameSeconds) {
    m_clock.advance(frameSeconds);
    size_t ticks = 0;
    while (m_clock.shouldUpdate()) {
        tick();
        ++ticks;
    }
    return ticks;
}

size_t Simulation::runFrame() {
    m_clock.startFrame();
    size_t ticks = 0;
    while (m_clock.shouldUpdate()) {
        tick();
        ++ticks;
    }
    m_clock.endFrame();
    return ticks;
}

} // namespace Deadlock

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE NavigationTests
#include <boost/test/unit_test.hpp>

#include "ai/Navigation.hpp"
#include "collisions/CollisionWorld.hpp"
#include "collisions/ObstacleSet.hpp"
#include "entities/Blueprints.hpp"
#include "entities/EntityRegistry.hpp"
#include "utils/Random.hpp"
#include <stdexcept>
#include <vector>

using namespace Deadlock;

namespace {

constexpr float TICK = 1.0f / 60.0f;

class RecordingDamageSink : public DamageSink {
public:
    void applyZombieAttack(const Entity& zombie, Entity&, float damage) override {
        attackers.push_back(zombie.id);
        total += damage;
    }

    std::vector<EntityID> attackers;
    float total{0.0f};
};

struct NavigationFixture {
    explicit NavigationFixture(std::vector<Obstacle> obstacleList = {},
                               const NavigationConfig& config = NavigationConfig{})
        : obstacles(std::move(obstacleList)), navigation(config) {
        navigation.attach(registry);
    }

    EntityID addZombie(const Vector2D& position, float radius, float speed) {
        Entity e;
        e.kind = EntityKind::Zombie;
        e.position = position;
        e.radius = radius;
        e.health = 100.0f;
        e.zombie.speed = speed;
        return registry.create(e);
    }

    SimulationContext context() {
        return SimulationContext{registry, obstacles, random, player, TICK, tick};
    }

    // Navigation, movement, collision and progress check, in simulation order
    void step() {
        ++tick;
        SimulationContext ctx = context();
        navigation.update(ctx, damage);
        for (auto& [id, entity] : registry.entities()) {
            if (!entity.alive || !entity.has(CAP_MOVABLE)) continue;
            entity.previousPosition = entity.position;
            entity.position += entity.velocity * TICK;
        }
        collision.step(registry, obstacles);
        navigation.evaluateProgress(ctx);
        registry.flushRemovals();
    }

    EntityRegistry registry;
    ObstacleSet obstacles;
    Random random{7};
    Navigation navigation;
    CollisionWorld collision;
    RecordingDamageSink damage;
    EntityID player{INVALID_ENTITY_ID};
    uint64_t tick{0};
};

NavigationConfig stuckScenarioConfig() {
    NavigationConfig config;
    config.stuckTicks = 10;
    config.stuckEpsilon = 0.5f;
    config.probeDistance = 24.0f;
    config.probeTimeout = 1.5f;
    return config;
}

} // namespace

BOOST_AUTO_TEST_SUITE(StuckRecoveryTests)

BOOST_AUTO_TEST_CASE(TestZombieAgainstObstacleProbesAndRecovers)
{
    const NavigationConfig config = stuckScenarioConfig();
    NavigationFixture fx({Obstacle::circle(Vector2D(20, 0), 16.0f)}, config);
    fx.player = fx.registry.create(Blueprints::player(Vector2D(100, 0)));
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 4.0f, 120.0f);

    for (int i = 0; i < config.stuckTicks - 1; ++i) {
        fx.step();
        BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Seeking);
    }
    BOOST_CHECK_EQUAL(fx.navigation.getState(zombie)->stuckTicks, config.stuckTicks - 1);

    fx.step();
    BOOST_REQUIRE_EQUAL(*fx.navigation.getMode(zombie), NavMode::Probing);

    // Straight ahead and both diagonals hit the obstacle; the first clear offset is +90
    const Vector2D heading = fx.navigation.getState(zombie)->probeHeading;
    BOOST_CHECK_SMALL(heading.getX(), 1e-4f);
    BOOST_CHECK_CLOSE(heading.getY(), 1.0f, 0.01f);

    const int timeoutTicks = static_cast<int>(config.probeTimeout / TICK);
    int recoveredAfter = -1;
    for (int i = 1; i <= timeoutTicks; ++i) {
        fx.step();
        if (*fx.navigation.getMode(zombie) == NavMode::Seeking) {
            recoveredAfter = i;
            break;
        }
    }
    BOOST_CHECK_GT(recoveredAfter, 0);

    // Recovery came from renewed progress, well before the timeout
    BOOST_CHECK_LT(recoveredAfter, timeoutTicks / 2);
    BOOST_CHECK_GT(fx.registry.find(zombie)->position.getY(), 20.0f);
}

BOOST_AUTO_TEST_CASE(TestHoldsPositionWhenEveryProbeIsBlocked)
{
    NavigationConfig config = stuckScenarioConfig();
    config.probeAngles = {0.0f};
    NavigationFixture fx({Obstacle::circle(Vector2D(20, 0), 16.0f)}, config);
    fx.player = fx.registry.create(Blueprints::player(Vector2D(100, 0)));
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 4.0f, 120.0f);

    for (int i = 0; i < config.stuckTicks; ++i) {
        fx.step();
    }
    BOOST_REQUIRE_EQUAL(*fx.navigation.getMode(zombie), NavMode::Probing);
    BOOST_CHECK(fx.navigation.getState(zombie)->probeHeading == Vector2D(0, 0));

    // Holding position is a normal outcome, retried every tick
    for (int i = 0; i < 30; ++i) {
        BOOST_CHECK_NO_THROW(fx.step());
        BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Probing);
        BOOST_CHECK(fx.registry.find(zombie)->velocity == Vector2D(0, 0));
        BOOST_CHECK(fx.registry.find(zombie)->position.isFinite());
    }

    // Timing out falls back to seeking
    for (int i = 0; i < 65; ++i) {
        fx.step();
    }
    BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Seeking);
}

BOOST_AUTO_TEST_CASE(TestZombieWalledInByHordeProbes)
{
    const NavigationConfig config = stuckScenarioConfig();
    NavigationFixture fx({}, config);
    fx.player = fx.registry.create(Blueprints::player(Vector2D(300, 0)));
    EntityID walker = fx.addZombie(Vector2D(0, 0), 10.0f, 120.0f);

    // Standing horde between walker and player, too heavy to shove aside
    std::vector<EntityID> horde;
    for (const Vector2D& position : {Vector2D(21, 0), Vector2D(15, 21), Vector2D(15, -21)}) {
        const EntityID id = fx.addZombie(position, 10.0f, 0.0f);
        fx.registry.find(id)->mass = 1000.0f;
        horde.push_back(id);
    }

    int probingAfter = -1;
    for (int i = 1; i <= config.stuckTicks + 5; ++i) {
        fx.step();
        BOOST_CHECK(!fx.navigation.getState(walker)->engaged);
        if (*fx.navigation.getMode(walker) == NavMode::Probing) {
            probingAfter = i;
            break;
        }
    }

    // One tick of partial progress before the horde stops it dead
    BOOST_CHECK_GE(probingAfter, config.stuckTicks);
    BOOST_CHECK_LE(probingAfter, config.stuckTicks + 2);
    BOOST_CHECK_LT(fx.registry.find(walker)->position.getX(), 2.0f);
    BOOST_CHECK_CLOSE(fx.registry.find(horde[0])->position.getX(), 21.0f, 0.5f);
    BOOST_CHECK(fx.damage.attackers.empty());
}

BOOST_AUTO_TEST_CASE(TestFreeZombieNeverProbes)
{
    NavigationFixture fx;
    fx.player = fx.registry.create(Blueprints::player(Vector2D(400, 0)));
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 10.0f, 60.0f);

    for (int i = 0; i < 60; ++i) {
        fx.step();
        BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Seeking);
    }
    // One second at 60 px/s straight toward the player
    BOOST_CHECK_CLOSE(fx.registry.find(zombie)->position.getX(), 60.0f, 0.1f);
    BOOST_CHECK_SMALL(fx.registry.find(zombie)->position.getY(), 1e-3f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AttackTests)

BOOST_AUTO_TEST_CASE(TestAttackRespectsCooldown)
{
    NavigationFixture fx;
    fx.player = fx.registry.create(Blueprints::player(Vector2D(26, 0)));
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 10.0f, 60.0f);
    Entity* z = fx.registry.find(zombie);
    z->zombie.attackRange = 6.0f;
    z->zombie.attackCooldown = 1.0f;
    z->zombie.contactDamage = 10.0f;

    // Update only, so the distance stays fixed at 2 px surface to surface
    SimulationContext ctx = fx.context();
    fx.navigation.update(ctx, fx.damage);
    BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Attacking);
    BOOST_REQUIRE_EQUAL(fx.damage.attackers.size(), 1u);
    BOOST_CHECK_EQUAL(fx.damage.attackers[0], zombie);

    fx.navigation.update(ctx, fx.damage);
    BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Seeking);
    BOOST_CHECK(fx.navigation.getState(zombie)->engaged);

    for (int i = 2; i < 30; ++i) {
        fx.navigation.update(ctx, fx.damage);
    }
    BOOST_CHECK_EQUAL(fx.damage.attackers.size(), 1u);

    for (int i = 30; i < 90; ++i) {
        fx.navigation.update(ctx, fx.damage);
    }
    BOOST_CHECK_EQUAL(fx.damage.attackers.size(), 2u);
    BOOST_CHECK_CLOSE(fx.damage.total, 20.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeDoesNotAttack)
{
    NavigationFixture fx;
    fx.player = fx.registry.create(Blueprints::player(Vector2D(200, 0)));
    fx.addZombie(Vector2D(0, 0), 10.0f, 60.0f);

    SimulationContext ctx = fx.context();
    for (int i = 0; i < 10; ++i) {
        fx.navigation.update(ctx, fx.damage);
    }
    BOOST_CHECK(fx.damage.attackers.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(StateLifetimeTests)

BOOST_AUTO_TEST_CASE(TestStateDiesWithEntity)
{
    NavigationFixture fx;
    fx.player = fx.registry.create(Blueprints::player(Vector2D(300, 0)));
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 10.0f, 60.0f);

    fx.step();
    BOOST_CHECK_EQUAL(fx.navigation.trackedCount(), 1u);
    BOOST_CHECK(fx.navigation.getMode(zombie).has_value());

    fx.registry.markForRemoval(zombie);
    fx.registry.flushRemovals();
    BOOST_CHECK_EQUAL(fx.navigation.trackedCount(), 0u);
    BOOST_CHECK(!fx.navigation.getMode(zombie).has_value());
    BOOST_CHECK(fx.navigation.getState(zombie) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestNoPlayerHoldsStill)
{
    NavigationFixture fx;
    EntityID zombie = fx.addZombie(Vector2D(0, 0), 10.0f, 60.0f);

    for (int i = 0; i < 20; ++i) {
        fx.step();
    }
    BOOST_CHECK(fx.registry.find(zombie)->velocity == Vector2D(0, 0));
    BOOST_CHECK_EQUAL(*fx.navigation.getMode(zombie), NavMode::Seeking);
    BOOST_CHECK_EQUAL(fx.navigation.getState(zombie)->stuckTicks, 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NavigationConfigTests)

BOOST_AUTO_TEST_CASE(TestInvalidConfigThrows)
{
    NavigationConfig noAngles;
    noAngles.probeAngles.clear();
    BOOST_CHECK_THROW(Navigation{noAngles}, std::invalid_argument);

    NavigationConfig zeroTicks;
    zeroTicks.stuckTicks = 0;
    BOOST_CHECK_THROW(Navigation{zeroTicks}, std::invalid_argument);

    NavigationConfig badTimeout;
    badTimeout.probeTimeout = 0.0f;
    BOOST_CHECK_THROW(Navigation{badTimeout}, std::invalid_argument);

    NavigationConfig badDistance;
    badDistance.probeDistance = -1.0f;
    BOOST_CHECK_THROW(Navigation{badDistance}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

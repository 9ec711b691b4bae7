/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionWorldTests
#include <boost/test/unit_test.hpp>

#include "collisions/AABB.hpp"
#include "collisions/CollisionWorld.hpp"
#include "collisions/Geometry.hpp"
#include "collisions/ObstacleSet.hpp"
#include "collisions/SpatialHash.hpp"
#include "entities/Blueprints.hpp"
#include "entities/EntityRegistry.hpp"
#include "utils/Vector2D.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace Deadlock;

namespace {

constexpr float TICK = 1.0f / 60.0f;

EntityID addZombie(EntityRegistry& registry, const Vector2D& position, float radius = 10.0f,
                   float mass = 1.0f) {
    Entity e;
    e.kind = EntityKind::Zombie;
    e.position = position;
    e.radius = radius;
    e.mass = mass;
    e.health = 100.0f;
    return registry.create(e);
}

// Stand-in for the simulation's movement step
void integrate(EntityRegistry& registry, float dt) {
    for (auto& [id, entity] : registry.entities()) {
        if (!entity.alive || !entity.has(CAP_MOVABLE)) continue;
        entity.previousPosition = entity.position;
        entity.position += entity.velocity * dt;
    }
}

size_t countEvents(const std::vector<CollisionEvent>& events, CollisionKind kind) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                             [kind](const CollisionEvent& e) { return e.kind == kind; }));
}

const CollisionEvent* findEvent(const std::vector<CollisionEvent>& events, CollisionKind kind) {
    auto it = std::find_if(events.begin(), events.end(),
                           [kind](const CollisionEvent& e) { return e.kind == kind; });
    return it == events.end() ? nullptr : &*it;
}

void checkNoPairOverlap(const EntityRegistry& registry, float tolerance) {
    for (const auto& [idA, a] : registry.entities()) {
        for (const auto& [idB, b] : registry.entities()) {
            if (idB <= idA || !a.isSolid() || !b.isSolid()) continue;
            const float distance = Vector2D::distance(a.position, b.position);
            BOOST_CHECK_GE(distance, a.radius + b.radius - tolerance);
        }
    }
}

} // namespace

BOOST_AUTO_TEST_SUITE(GeometryTests)

BOOST_AUTO_TEST_CASE(TestSegmentCircleEntry)
{
    auto t = Geometry::segmentCircleEntry(Vector2D(0, 0), Vector2D(100, 0), Vector2D(50, 0), 10.0f);
    BOOST_REQUIRE(t.has_value());
    BOOST_CHECK_CLOSE(*t, 0.4f, 0.01f);

    // Starting inside reports immediate contact
    auto inside = Geometry::segmentCircleEntry(Vector2D(48, 0), Vector2D(100, 0), Vector2D(50, 0), 10.0f);
    BOOST_REQUIRE(inside.has_value());
    BOOST_CHECK_EQUAL(*inside, 0.0f);

    BOOST_CHECK(!Geometry::segmentCircleEntry(Vector2D(0, 20), Vector2D(100, 20), Vector2D(50, 0), 10.0f));
    BOOST_CHECK(!Geometry::segmentCircleEntry(Vector2D(0, 0), Vector2D(30, 0), Vector2D(50, 0), 10.0f));
    BOOST_CHECK(!Geometry::segmentCircleEntry(Vector2D(0, 0), Vector2D(0, 0), Vector2D(50, 0), 10.0f));
}

BOOST_AUTO_TEST_CASE(TestSegmentBoxEntry)
{
    AABB box(50.0f, 0.0f, 2.0f, 20.0f);
    auto t = box.segmentEntry(Vector2D(0, 0), Vector2D(100, 0));
    BOOST_REQUIRE(t.has_value());
    BOOST_CHECK_CLOSE(*t, 0.48f, 0.01f);

    auto inflated = box.segmentEntry(Vector2D(0, 0), Vector2D(100, 0), 3.0f);
    BOOST_REQUIRE(inflated.has_value());
    BOOST_CHECK_CLOSE(*inflated, 0.45f, 0.01f);

    BOOST_CHECK(!box.segmentEntry(Vector2D(0, 30), Vector2D(100, 30)));
    BOOST_CHECK(!box.segmentEntry(Vector2D(0, 0), Vector2D(40, 0)));
}

BOOST_AUTO_TEST_CASE(TestTieBreakDirectionIsStableUnitVector)
{
    const Vector2D first = Geometry::tieBreakDirection(3, 7);
    const Vector2D again = Geometry::tieBreakDirection(3, 7);
    BOOST_CHECK(first == again);
    BOOST_CHECK_CLOSE(first.length(), 1.0f, 0.01f);
    BOOST_CHECK(first.isFinite());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SpatialHashTests)

BOOST_AUTO_TEST_CASE(TestNeighborQueryAcrossCellBoundary)
{
    SpatialHash grid(64.0f);
    grid.insertPoint(1, Vector2D(63.9f, 10.0f));
    grid.insertPoint(2, Vector2D(64.1f, 10.0f));
    grid.insertPoint(3, Vector2D(400.0f, 400.0f));

    BOOST_CHECK_EQUAL(grid.cellOf(Vector2D(63.9f, 10.0f)).x, 0);
    BOOST_CHECK_EQUAL(grid.cellOf(Vector2D(64.1f, 10.0f)).x, 1);
    BOOST_CHECK_EQUAL(grid.cellOf(Vector2D(-0.5f, 0.0f)).x, -1);

    std::vector<EntityID> neighbors;
    grid.queryNeighbors(Vector2D(63.9f, 10.0f), neighbors);
    BOOST_CHECK(std::find(neighbors.begin(), neighbors.end(), 2u) != neighbors.end());
    BOOST_CHECK(std::find(neighbors.begin(), neighbors.end(), 3u) == neighbors.end());
}

BOOST_AUTO_TEST_CASE(TestAreaQueryDeduplicates)
{
    SpatialHash grid(32.0f);
    grid.insert(7, AABB(32.0f, 32.0f, 40.0f, 40.0f)); // spans many cells
    BOOST_CHECK_GT(grid.cellCount(), 1u);
    BOOST_CHECK_EQUAL(grid.size(), 1u);

    std::vector<EntityID> found;
    grid.query(AABB(32.0f, 32.0f, 60.0f, 60.0f), found);
    BOOST_REQUIRE_EQUAL(found.size(), 1u);
    BOOST_CHECK_EQUAL(found[0], 7u);
}

BOOST_AUTO_TEST_CASE(TestInvalidCellSizeThrows)
{
    BOOST_CHECK_THROW(SpatialHash{0.0f}, std::invalid_argument);
    SpatialHash grid;
    BOOST_CHECK_THROW(grid.setCellSize(-4.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObstacleSetTests)

BOOST_AUTO_TEST_CASE(TestInvalidObstaclesRejected)
{
    BOOST_CHECK_THROW(ObstacleSet({Obstacle::circle(Vector2D(0, 0), 0.0f)}), std::invalid_argument);
    BOOST_CHECK_THROW(ObstacleSet({Obstacle::box(Vector2D(0, 0), 5.0f, -1.0f)}), std::invalid_argument);
    BOOST_CHECK_THROW(ObstacleSet({}, AABB(0.0f, 0.0f, 0.0f, 10.0f)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestOverlapAndBounds)
{
    ObstacleSet obstacles({Obstacle::circle(Vector2D(100, 100), 20.0f),
                           Obstacle::box(Vector2D(300, 100), 10.0f, 50.0f)},
                          AABB::fromMinMax(Vector2D(0, 0), Vector2D(400, 400)));

    BOOST_CHECK(obstacles.overlapsCircle(Vector2D(125, 100), 10.0f));
    BOOST_CHECK(!obstacles.overlapsCircle(Vector2D(135, 100), 10.0f));
    BOOST_CHECK(obstacles.overlapsCircle(Vector2D(300, 100), 1.0f));

    const Vector2D clamped = obstacles.clampToBounds(Vector2D(-20, 395), 10.0f);
    BOOST_CHECK_CLOSE(clamped.getX(), 10.0f, 0.01f);
    BOOST_CHECK_CLOSE(clamped.getY(), 390.0f, 0.01f);

    BOOST_CHECK(obstacles.isOutOfBounds(Vector2D(401, 0)));
    BOOST_CHECK(!obstacles.isOutOfBounds(Vector2D(400, 400)));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PairResolutionTests)

BOOST_AUTO_TEST_CASE(TestOverlappingPairSeparated)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(0, 0));
    addZombie(registry, Vector2D(12, 0));

    CollisionWorld world;
    world.rebuild(registry);
    world.resolvePairs(registry);

    checkNoPairOverlap(registry, world.getConfig().overlapEpsilon + 1e-3f);
    BOOST_CHECK_EQUAL(countEvents(world.getEvents(), CollisionKind::EntityEntity), 1u);
    BOOST_REQUIRE_EQUAL(world.getPairs().size(), 1u);
    BOOST_CHECK(world.getPairs()[0] == std::make_pair(EntityID{1}, EntityID{2}));
}

BOOST_AUTO_TEST_CASE(TestMassRatioSplitsPush)
{
    EntityRegistry registry;
    EntityID heavy = addZombie(registry, Vector2D(0, 0), 10.0f, 4.0f);
    EntityID light = addZombie(registry, Vector2D(10, 0), 10.0f, 1.0f);

    CollisionWorld world;
    world.rebuild(registry);
    world.resolvePairs(registry);

    BOOST_CHECK_CLOSE(registry.find(heavy)->position.getX(), -2.0f, 0.1f);
    BOOST_CHECK_CLOSE(registry.find(light)->position.getX(), 18.0f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestClustersConverge)
{
    EntityRegistry registry;
    // A chain and a tight square, both far enough apart not to interact
    for (int i = 0; i < 5; ++i) {
        addZombie(registry, Vector2D(15.0f * i, 0.0f));
    }
    addZombie(registry, Vector2D(500, 500));
    addZombie(registry, Vector2D(510, 500));
    addZombie(registry, Vector2D(500, 510));
    addZombie(registry, Vector2D(510, 510));

    CollisionWorld world;
    world.rebuild(registry);
    world.resolvePairs(registry);

    checkNoPairOverlap(registry, world.getConfig().overlapEpsilon + 1e-3f);
}

BOOST_AUTO_TEST_CASE(TestChainSeparatesWithDefaultConfig)
{
    EntityRegistry registry;
    for (int i = 0; i < 5; ++i) {
        addZombie(registry, Vector2D(15.0f * i, 0.0f));
    }

    CollisionWorld world;
    world.rebuild(registry);
    world.resolvePairs(registry);

    checkNoPairOverlap(registry, world.getConfig().overlapEpsilon + 1e-3f);
    // Every neighbouring link was pushed at some pass
    BOOST_CHECK_EQUAL(countEvents(world.getEvents(), CollisionKind::EntityEntity), 4u);
}

BOOST_AUTO_TEST_CASE(TestContactCreatedByPushIsReported)
{
    EntityRegistry registry;
    EntityID left = addZombie(registry, Vector2D(0, 0));
    EntityID middle = addZombie(registry, Vector2D(25, 0));
    EntityID right = addZombie(registry, Vector2D(30, 0));

    CollisionWorld world;
    const auto& events = world.step(registry, ObstacleSet());

    checkNoPairOverlap(registry, world.getConfig().overlapEpsilon + 1e-3f);

    auto reported = [&events](EntityID low, EntityID high) {
        return std::count_if(events.begin(), events.end(), [&](const CollisionEvent& e) {
            return e.kind == CollisionKind::EntityEntity && e.a == low && e.b == high;
        });
    };
    // left and middle only touch after middle is pushed out of right
    BOOST_CHECK_EQUAL(reported(middle, right), 1);
    BOOST_CHECK_EQUAL(reported(left, middle), 1);
    BOOST_CHECK_EQUAL(reported(left, right), 0);
}

BOOST_AUTO_TEST_CASE(TestIdenticalPointsSeparateDeterministically)
{
    auto run = []() {
        EntityRegistry registry;
        addZombie(registry, Vector2D(0, 0), 12.0f);
        addZombie(registry, Vector2D(0, 0), 12.0f);
        CollisionWorld world;
        world.step(registry, ObstacleSet());
        return std::make_pair(registry.find(1)->position, registry.find(2)->position);
    };

    const auto first = run();
    const auto second = run();

    BOOST_CHECK(first.first != first.second);
    BOOST_CHECK(first.first.isFinite());
    BOOST_CHECK(first.second.isFinite());
    BOOST_CHECK_CLOSE(Vector2D::distance(first.first, first.second), 24.0f, 0.1f);
    BOOST_CHECK(first.first == second.first);
    BOOST_CHECK(first.second == second.second);
}

BOOST_AUTO_TEST_CASE(TestPairsAcrossCellBoundary)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(63.9f, 10.0f));
    addZombie(registry, Vector2D(64.1f, 10.0f));

    CollisionWorld world;
    world.rebuild(registry);

    std::vector<EntityID> neighbors;
    world.queryNeighbors(*registry.find(1), neighbors);
    BOOST_REQUIRE_EQUAL(neighbors.size(), 1u);
    BOOST_CHECK_EQUAL(neighbors[0], 2u);

    world.resolvePairs(registry);
    checkNoPairOverlap(registry, world.getConfig().overlapEpsilon + 1e-3f);
}

BOOST_AUTO_TEST_CASE(TestPairsSortedAndUnique)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(0, 0));
    addZombie(registry, Vector2D(5, 0));
    addZombie(registry, Vector2D(0, 5));

    CollisionWorld world;
    world.rebuild(registry);
    world.resolvePairs(registry);

    const auto& pairs = world.getPairs();
    BOOST_REQUIRE_EQUAL(pairs.size(), 3u);
    BOOST_CHECK(std::is_sorted(pairs.begin(), pairs.end()));
    for (const auto& [low, high] : pairs) {
        BOOST_CHECK_LT(low, high);
    }
}

BOOST_AUTO_TEST_CASE(TestLargeBodyRaisesCellSize)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(0, 0), 50.0f);

    CollisionWorld world;
    world.rebuild(registry);
    BOOST_CHECK_CLOSE(world.getEffectiveCellSize(), 100.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestInvalidConfigThrows)
{
    CollisionConfig noIterations;
    noIterations.solverIterations = 0;
    BOOST_CHECK_THROW(CollisionWorld{noIterations}, std::invalid_argument);

    CollisionConfig badCell;
    badCell.cellSize = -1.0f;
    BOOST_CHECK_THROW(CollisionWorld{badCell}, std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObstacleResolutionTests)

BOOST_AUTO_TEST_CASE(TestPushedOutOfCircle)
{
    EntityRegistry registry;
    EntityID zombie = addZombie(registry, Vector2D(0, 0));
    ObstacleSet obstacles({Obstacle::circle(Vector2D(15, 0), 10.0f)});

    CollisionWorld world;
    world.rebuild(registry);
    world.resolveObstacles(registry, obstacles);

    const Entity* z = registry.find(zombie);
    BOOST_CHECK_CLOSE(z->position.getX(), -5.0f, 0.1f);
    BOOST_CHECK_LE(obstacles[0].penetrationDepth(z->position, z->radius), world.getConfig().overlapEpsilon);

    const CollisionEvent* event = findEvent(world.getEvents(), CollisionKind::EntityObstacle);
    BOOST_REQUIRE(event != nullptr);
    BOOST_CHECK_EQUAL(event->a, zombie);
    BOOST_CHECK_EQUAL(event->b, INVALID_ENTITY_ID);
    BOOST_REQUIRE(event->obstacle.has_value());
    BOOST_CHECK_EQUAL(*event->obstacle, 0u);
}

BOOST_AUTO_TEST_CASE(TestObstacleIndexKeptApartFromEntityIds)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(-400, 0));
    EntityID zombie = addZombie(registry, Vector2D(0, 0));
    // Index 1 is also the id of a live entity
    ObstacleSet obstacles({Obstacle::circle(Vector2D(500, 500), 10.0f),
                           Obstacle::circle(Vector2D(15, 0), 10.0f)});

    CollisionWorld world;
    const auto& events = world.step(registry, obstacles);

    BOOST_REQUIRE_EQUAL(countEvents(events, CollisionKind::EntityObstacle), 1u);
    const CollisionEvent* event = findEvent(events, CollisionKind::EntityObstacle);
    BOOST_CHECK_EQUAL(event->a, zombie);
    BOOST_CHECK_EQUAL(event->b, INVALID_ENTITY_ID);
    BOOST_REQUIRE(event->obstacle.has_value());
    BOOST_CHECK_EQUAL(*event->obstacle, 1u);

    // Entity-only events never carry an obstacle index
    for (const CollisionEvent& e : events) {
        if (e.kind != CollisionKind::EntityObstacle) {
            BOOST_CHECK(!e.obstacle.has_value());
        }
    }
}

BOOST_AUTO_TEST_CASE(TestCenterInsideBoxLeavesThroughNearestFace)
{
    EntityRegistry registry;
    EntityID zombie = addZombie(registry, Vector2D(95, 0));
    ObstacleSet obstacles({Obstacle::box(Vector2D(50, 0), 50.0f, 50.0f)});

    CollisionWorld world;
    world.rebuild(registry);
    world.resolveObstacles(registry, obstacles);

    const Entity* z = registry.find(zombie);
    BOOST_CHECK_CLOSE(z->position.getX(), 110.0f, 0.1f);
    BOOST_CHECK_LE(obstacles[0].penetrationDepth(z->position, z->radius), world.getConfig().overlapEpsilon);
}

BOOST_AUTO_TEST_CASE(TestNoResidualPenetrationAfterStep)
{
    EntityRegistry registry;
    addZombie(registry, Vector2D(100, 100), 12.0f);
    addZombie(registry, Vector2D(230, 95), 9.0f);
    addZombie(registry, Vector2D(300, 300), 18.0f);
    ObstacleSet obstacles({Obstacle::circle(Vector2D(110, 100), 16.0f),
                           Obstacle::box(Vector2D(240, 100), 20.0f, 40.0f),
                           Obstacle::circle(Vector2D(500, 500), 30.0f)},
                          AABB::fromMinMax(Vector2D(0, 0), Vector2D(1000, 1000)));

    CollisionWorld world;
    world.step(registry, obstacles);

    for (const auto& [id, entity] : registry.entities()) {
        for (const Obstacle& obstacle : obstacles.obstacles()) {
            BOOST_CHECK_LE(obstacle.penetrationDepth(entity.position, entity.radius),
                           world.getConfig().overlapEpsilon);
        }
    }
}

BOOST_AUTO_TEST_CASE(TestClampedToWorldBounds)
{
    EntityRegistry registry;
    EntityID zombie = addZombie(registry, Vector2D(-5, 50));
    ObstacleSet obstacles({}, AABB::fromMinMax(Vector2D(0, 0), Vector2D(100, 100)));

    CollisionWorld world;
    world.step(registry, obstacles);

    BOOST_CHECK_CLOSE(registry.find(zombie)->position.getX(), 10.0f, 0.01f);
    BOOST_CHECK_CLOSE(registry.find(zombie)->position.getY(), 50.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ProjectileTests)

BOOST_AUTO_TEST_CASE(TestShotPassesLowCoverWithoutTunneling)
{
    EntityRegistry registry;
    EntityID player = registry.create(Blueprints::player(Vector2D(0, 0)));
    EntityID target = addZombie(registry, Vector2D(55, 0));
    // 40 px per tick against a 4 px thick crate
    EntityID shot = registry.create(Blueprints::projectile(player, Vector2D(20, 0), Vector2D(2400, 0)));
    ObstacleSet obstacles({Obstacle::box(Vector2D(40, 0), 2.0f, 20.0f, false)});

    integrate(registry, TICK);
    CollisionWorld world;
    const auto& events = world.step(registry, obstacles);

    const CollisionEvent* hit = findEvent(events, CollisionKind::ProjectileHit);
    BOOST_REQUIRE(hit != nullptr);
    BOOST_CHECK_EQUAL(hit->a, shot);
    BOOST_CHECK_EQUAL(hit->b, target);
    BOOST_CHECK_CLOSE(hit->point.getX(), 43.0f, 0.1f);

    const Entity* projectile = registry.find(shot);
    BOOST_CHECK(!projectile->alive);
    BOOST_CHECK_CLOSE(projectile->position.getX(), 43.0f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestFastShotHitsTargetItPassedThrough)
{
    EntityRegistry registry;
    EntityID target = addZombie(registry, Vector2D(130, 0));
    // Both segment ends lie outside the target
    EntityID shot = registry.create(Blueprints::projectile(INVALID_ENTITY_ID, Vector2D(100, 0), Vector2D(3600, 0)));

    integrate(registry, TICK);
    BOOST_CHECK_CLOSE(registry.find(shot)->position.getX(), 160.0f, 0.1f);

    CollisionWorld world;
    const auto& events = world.step(registry, ObstacleSet());
    const CollisionEvent* hit = findEvent(events, CollisionKind::ProjectileHit);
    BOOST_REQUIRE(hit != nullptr);
    BOOST_CHECK_EQUAL(hit->b, target);
    BOOST_CHECK_CLOSE(hit->point.getX(), 118.0f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestWallStopsShot)
{
    EntityRegistry registry;
    EntityID player = registry.create(Blueprints::player(Vector2D(0, 0)));
    addZombie(registry, Vector2D(55, 0));
    EntityID shot = registry.create(Blueprints::projectile(player, Vector2D(20, 0), Vector2D(2400, 0)));
    ObstacleSet obstacles({Obstacle::box(Vector2D(40, 0), 2.0f, 20.0f)});

    integrate(registry, TICK);
    CollisionWorld world;
    const auto& events = world.step(registry, obstacles);

    BOOST_CHECK_EQUAL(countEvents(events, CollisionKind::ProjectileHit), 0u);
    const CollisionEvent* blocked = findEvent(events, CollisionKind::EntityObstacle);
    BOOST_REQUIRE(blocked != nullptr);
    BOOST_CHECK_EQUAL(blocked->a, shot);
    BOOST_CHECK_EQUAL(blocked->b, INVALID_ENTITY_ID);
    BOOST_REQUIRE(blocked->obstacle.has_value());
    BOOST_CHECK_EQUAL(*blocked->obstacle, 0u);
    BOOST_CHECK_CLOSE(blocked->point.getX(), 36.0f, 0.1f);
    BOOST_CHECK(!registry.find(shot)->alive);
}

BOOST_AUTO_TEST_CASE(TestOwnerIsNeverHit)
{
    EntityRegistry registry;
    EntityID player = registry.create(Blueprints::player(Vector2D(0, 0)));
    // Spawned inside its owner's circle
    EntityID shot = registry.create(Blueprints::projectile(player, Vector2D(5, 0), Vector2D(600, 0)));

    integrate(registry, TICK);
    CollisionWorld world;
    const auto& events = world.step(registry, ObstacleSet());

    BOOST_CHECK_EQUAL(countEvents(events, CollisionKind::ProjectileHit), 0u);
    BOOST_CHECK(registry.find(shot)->alive);
}

BOOST_AUTO_TEST_CASE(TestExplosionCatchesBystanders)
{
    EntityRegistry registry;
    EntityID player = registry.create(Blueprints::player(Vector2D(0, 0)));
    EntityID target = addZombie(registry, Vector2D(130, 0));
    EntityID bystander = addZombie(registry, Vector2D(130, 40));
    EntityID distant = addZombie(registry, Vector2D(300, 0));
    registry.create(Blueprints::projectile(player, Vector2D(100, 0), Vector2D(3600, 0), 25.0f, 1200.0f, 50.0f));

    integrate(registry, TICK);
    CollisionWorld world;
    const auto& events = world.step(registry, ObstacleSet());

    BOOST_CHECK_EQUAL(countEvents(events, CollisionKind::ProjectileHit), 1u);
    BOOST_REQUIRE_EQUAL(countEvents(events, CollisionKind::ExplosionHit), 1u);
    const CollisionEvent* blast = findEvent(events, CollisionKind::ExplosionHit);
    BOOST_CHECK_EQUAL(blast->b, bystander);
    BOOST_CHECK_NE(blast->b, target);
    BOOST_CHECK_NE(blast->b, distant);
    BOOST_CHECK_NE(blast->b, player);
}

BOOST_AUTO_TEST_CASE(TestRangeExpiry)
{
    EntityRegistry registry;
    EntityID shot = registry.create(Blueprints::projectile(INVALID_ENTITY_ID, Vector2D(0, 0),
                                                           Vector2D(2400, 0), 25.0f, 30.0f));
    integrate(registry, TICK);
    CollisionWorld world;
    world.step(registry, ObstacleSet());
    BOOST_CHECK(!registry.find(shot)->alive);
}

BOOST_AUTO_TEST_CASE(TestLeavingWorldExpires)
{
    EntityRegistry registry;
    EntityID shot = registry.create(Blueprints::projectile(INVALID_ENTITY_ID, Vector2D(90, 50),
                                                           Vector2D(1200, 0)));
    ObstacleSet obstacles({}, AABB::fromMinMax(Vector2D(0, 0), Vector2D(100, 100)));

    integrate(registry, TICK);
    CollisionWorld world;
    world.step(registry, obstacles);
    BOOST_CHECK(!registry.find(shot)->alive);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PickupTests)

BOOST_AUTO_TEST_CASE(TestPickupContactWithinRadius)
{
    EntityRegistry registry;
    EntityID player = registry.create(Blueprints::player(Vector2D(0, 0)));
    EntityID nearby = registry.create(Blueprints::pickup(Vector2D(40, 0)));
    registry.create(Blueprints::pickup(Vector2D(60, 0)));

    CollisionWorld world;
    const auto& events = world.step(registry, ObstacleSet());

    BOOST_REQUIRE_EQUAL(countEvents(events, CollisionKind::PickupContact), 1u);
    const CollisionEvent* contact = findEvent(events, CollisionKind::PickupContact);
    BOOST_CHECK_EQUAL(contact->a, player);
    BOOST_CHECK_EQUAL(contact->b, nearby);

    // Pickups are not pushed around
    BOOST_CHECK_CLOSE(registry.find(nearby)->position.getX(), 40.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

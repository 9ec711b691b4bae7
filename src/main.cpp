/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/Simulation.hpp"
#include "entities/Blueprints.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <format>
#include <limits>
#include <string>
#include <vector>

using namespace Deadlock;

namespace {

struct Options {
    std::string configPath{"res/simulation.json"};
    uint64_t ticks{3600};
    bool realtime{false};
};

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--realtime") {
            options.realtime = true;
        } else if (arg == "--ticks" && i + 1 < argc) {
            char* end = nullptr;
            const unsigned long long value = std::strtoull(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0' || value == 0) {
                SIM_ERROR(std::format("Invalid tick count '{}'", argv[i]));
                return false;
            }
            options.ticks = value;
        } else if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else {
            SIM_ERROR(std::format("Unknown argument '{}'", arg));
            std::printf("usage: deadlock_sim [--config path] [--ticks n] [--realtime]\n");
            return false;
        }
    }
    return true;
}

// Walls block shots, crates are low cover
std::vector<Obstacle> buildArena(float width, float height) {
    const float cx = width * 0.5f;
    const float cy = height * 0.5f;
    return {
        Obstacle::box(Vector2D(cx - 300.0f, cy), 16.0f, 180.0f),
        Obstacle::box(Vector2D(cx + 300.0f, cy), 16.0f, 180.0f),
        Obstacle::box(Vector2D(cx, cy - 320.0f), 220.0f, 16.0f),
        Obstacle::circle(Vector2D(cx - 520.0f, cy - 480.0f), 40.0f),
        Obstacle::circle(Vector2D(cx + 610.0f, cy + 430.0f), 56.0f),
        Obstacle::circle(Vector2D(cx + 150.0f, cy + 520.0f), 28.0f),
        Obstacle::box(Vector2D(cx - 140.0f, cy + 160.0f), 20.0f, 20.0f, false),
        Obstacle::box(Vector2D(cx + 120.0f, cy - 150.0f), 20.0f, 20.0f, false),
    };
}

// Stand-in weapon: shoots the nearest zombie on a fixed cadence
void fireAtNearest(Simulation& sim, bool explosive) {
    const Entity* player = sim.entities().find(sim.getPlayer());
    if (!player || !player->alive) {
        return;
    }

    const Entity* nearest = nullptr;
    float bestDistSq = std::numeric_limits<float>::max();
    sim.entities().forEachAlive(EntityKind::Zombie, [&](const Entity& zombie) {
        const float d = Vector2D::distanceSquared(zombie.position, player->position);
        if (d < bestDistSq) {
            bestDistSq = d;
            nearest = &zombie;
        }
    });
    if (!nearest) {
        return;
    }

    const Vector2D aim = (nearest->position - player->position).normalized();
    const Vector2D muzzle = player->position + aim * (player->radius + 4.0f);
    const float damage = explosive ? 80.0f : 34.0f;
    const float blast = explosive ? 90.0f : 0.0f;
    sim.entities().create(Blueprints::projectile(player->id, muzzle, aim * 900.0f, damage, 1200.0f, blast));
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        return 2;
    }

    try {
        SimulationConfig config;
        if (!config.loadFromFile(options.configPath)) {
            SIM_WARN("Falling back to built-in defaults");
        }
        config.clock.frameLimiting = options.realtime;

        Simulation sim(config, buildArena(config.worldWidth, config.worldHeight));
        const Vector2D center(config.worldWidth * 0.5f, config.worldHeight * 0.5f);
        const EntityID player = sim.spawnPlayer(center);

        sim.seedInitialWave();

        const float orbitRadius = 120.0f;
        const float orbitSpeed = 0.4f; // rad/s

        while (sim.getTickCount() < options.ticks) {
            // Player jogs in a circle around the arena center
            if (Entity* p = sim.entities().find(player); p && p->alive) {
                const float t = static_cast<float>(sim.getTickCount()) * sim.getClock().getFixedTimestep();
                const Vector2D target = center + Vector2D(std::cos(t * orbitSpeed), std::sin(t * orbitSpeed)) * orbitRadius;
                p->velocity = (target - p->position) * 2.0f;
            }

            const uint64_t tick = sim.getTickCount();
            if (tick % 12 == 0) {
                fireAtNearest(sim, tick % 300 == 0);
            }

            if (options.realtime) {
                sim.runFrame();
            } else {
                sim.tick();
            }

            if (sim.getLastReport().playerDead) {
                SIM_INFO(std::format("Player died at tick {}", sim.getTickCount()));
                break;
            }
        }

        const ScoreTracker& score = sim.getScore();
        SIM_INFO(std::format("Ran {} ticks ({:.1f}s): score {}, kills {} (weak {}, fast {}, tough {}), "
                             "{} zombies alive, {} pickups on the map, {} skipped spawn cycles",
                             sim.getTickCount(), score.elapsedSeconds(), score.score(), score.getKills(),
                             score.getKills(ZombieType::Weak), score.getKills(ZombieType::Fast),
                             score.getKills(ZombieType::Tough), sim.entities().countAlive(EntityKind::Zombie),
                             sim.entities().countAlive(EntityKind::Pickup),
                             sim.getDirector().getSkippedCycles()));
        std::printf("score=%lld kills=%u ticks=%llu\n", static_cast<long long>(score.score()),
                    score.getKills(), static_cast<unsigned long long>(sim.getTickCount()));
    } catch (const std::exception& e) {
        SIM_CRITICAL(std::format("Simulation aborted: {}", e.what()));
        return 1;
    }

    return 0;
}

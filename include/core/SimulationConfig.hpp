/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include "ai/NavigationConfig.hpp"
#include "collisions/CollisionConfig.hpp"
#include "core/SimulationClock.hpp"
#include "director/DirectorConfig.hpp"
#include "director/PickupSpawnConfig.hpp"
#include "entities/ZombieArchetypes.hpp"
#include <cstdint>
#include <string>

namespace Deadlock
{

class JsonValue;

/**
 * Complete configuration of one Simulation
 *
 * JSON layout mirrors the member structs, one object per category:
 *   clock, world, collision, navigation, director, pickups, zombies
 * Keys use the member names. Missing keys keep their defaults; keys with the
 * wrong type or unknown keys are logged and skipped.
 */
struct SimulationConfig
{
    ClockConfig clock;
    CollisionConfig collision;
    NavigationConfig navigation;
    DirectorConfig director;
    PickupSpawnConfig pickups;
    ZombieArchetypeTable zombies = defaultZombieArchetypes();

    // World
    float worldWidth = 2400.0f;                   // Map extent (px); obstacles and spawns stay inside
    float worldHeight = 2400.0f;
    uint64_t seed = 0x5EED;                       // Random source seed

    /**
     * Reads overrides from a JSON file on top of the current values
     * @return false if the file cannot be read or is not a JSON object
     */
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& json);

    /**
     * Checks every value range
     * @param error receives the first problem found
     */
    bool validate(std::string& error) const;

private:
    bool apply(const JsonValue& root, const std::string& source);
};

} // namespace Deadlock

#endif // SIMULATION_CONFIG_HPP

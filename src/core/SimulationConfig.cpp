/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimulationConfig.hpp"
#include "ai/Navigation.hpp"
#include "collisions/CollisionWorld.hpp"
#include "core/Logger.hpp"
#include "director/Director.hpp"
#include "director/PickupSpawner.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <set>
#include <stdexcept>

namespace Deadlock {

namespace {

/**
 * Reads typed keys out of one category object, remembering which keys were
 * used so the rest can be reported as unknown.
 */
class CategoryReader {
public:
    CategoryReader(std::string name, const JsonObject& object)
        : m_name(std::move(name)), m_object(object) {}

    ~CategoryReader() {
        for (const auto& [key, value] : m_object) {
            if (!m_used.contains(key)) {
                CONFIG_WARN(std::format("Unknown key '{}.{}' ignored", m_name, key));
            }
        }
    }

    void read(const char* key, float& target) {
        if (const JsonValue* value = take(key)) {
            if (auto number = value->tryAsNumber()) {
                target = static_cast<float>(*number);
            } else {
                wrongType(key, "a number");
            }
        }
    }

    void read(const char* key, int& target) {
        if (const JsonValue* value = take(key)) {
            auto number = value->tryAsNumber();
            if (number && std::floor(*number) == *number) {
                target = static_cast<int>(*number);
            } else {
                wrongType(key, "an integer");
            }
        }
    }

    void read(const char* key, uint64_t& target) {
        if (const JsonValue* value = take(key)) {
            auto number = value->tryAsNumber();
            if (number && *number >= 0.0 && std::floor(*number) == *number) {
                target = static_cast<uint64_t>(*number);
            } else {
                wrongType(key, "a non-negative integer");
            }
        }
    }

    void read(const char* key, bool& target) {
        if (const JsonValue* value = take(key)) {
            if (auto flag = value->tryAsBool()) {
                target = *flag;
            } else {
                wrongType(key, "a boolean");
            }
        }
    }

    // Returns the raw value for keys with structured content
    const JsonValue* take(const char* key) {
        auto it = m_object.find(key);
        if (it == m_object.end()) {
            return nullptr;
        }
        m_used.insert(key);
        return &it->second;
    }

    void wrongType(const char* key, const char* expected) const {
        CONFIG_WARN(std::format("'{}.{}' must be {}, keeping default", m_name, key, expected));
    }

private:
    std::string m_name;
    const JsonObject& m_object;
    std::set<std::string> m_used;
};

void readClock(CategoryReader& reader, ClockConfig& clock) {
    reader.read("tickRate", clock.tickRate);
    reader.read("maxFrameTime", clock.maxFrameTime);
    reader.read("targetFPS", clock.targetFPS);
    reader.read("frameLimiting", clock.frameLimiting);
}

void readCollision(CategoryReader& reader, CollisionConfig& collision) {
    reader.read("cellSize", collision.cellSize);
    reader.read("solverIterations", collision.solverIterations);
    reader.read("overlapEpsilon", collision.overlapEpsilon);
    reader.read("pickupRadiusMultiplier", collision.pickupRadiusMultiplier);
}

void readNavigation(CategoryReader& reader, NavigationConfig& navigation) {
    reader.read("stuckEpsilon", navigation.stuckEpsilon);
    reader.read("stuckTicks", navigation.stuckTicks);
    reader.read("probeDistance", navigation.probeDistance);
    reader.read("probeTimeout", navigation.probeTimeout);
    reader.read("probeTolerance", navigation.probeTolerance);

    if (const JsonValue* angles = reader.take("probeAngles")) {
        const JsonArray* array = angles->tryAsArray();
        std::vector<float> parsed;
        bool ok = array != nullptr;
        if (array) {
            for (const JsonValue& angle : *array) {
                auto number = angle.tryAsNumber();
                if (!number) {
                    ok = false;
                    break;
                }
                parsed.push_back(static_cast<float>(*number));
            }
        }
        if (ok) {
            navigation.probeAngles = std::move(parsed);
        } else {
            reader.wrongType("probeAngles", "an array of numbers");
        }
    }
}

bool readBreakpoint(const JsonValue& value, TypeWeightBreakpoint& out) {
    const JsonValue* time = value.find("time");
    const JsonValue* weights = value.find("weights");
    if (!time || !time->isNumber() || !weights || !weights->isArray() ||
        weights->size() != ZOMBIE_TYPE_COUNT) {
        return false;
    }
    out.time = static_cast<float>(time->asNumber());
    for (size_t k = 0; k < ZOMBIE_TYPE_COUNT; ++k) {
        auto w = weights->asArray()[k].tryAsNumber();
        if (!w) {
            return false;
        }
        out.weights[k] = static_cast<float>(*w);
    }
    return true;
}

void readDirector(CategoryReader& reader, DirectorConfig& director) {
    reader.read("baseCount", director.baseCount);
    reader.read("countRate", director.countRate);
    reader.read("maxCount", director.maxCount);
    reader.read("initialSpawnInterval", director.initialSpawnInterval);
    reader.read("minSpawnInterval", director.minSpawnInterval);
    reader.read("intervalDecay", director.intervalDecay);
    reader.read("intervalDecayPeriod", director.intervalDecayPeriod);
    reader.read("minSpawnRadius", director.minSpawnRadius);
    reader.read("maxSpawnRadius", director.maxSpawnRadius);
    reader.read("minDistanceFromPlayer", director.minDistanceFromPlayer);
    reader.read("minSpawnSeparation", director.minSpawnSeparation);
    reader.read("spawnClearance", director.spawnClearance);
    reader.read("maxSpawnAttempts", director.maxSpawnAttempts);
    reader.read("initialCount", director.initialCount);

    if (const JsonValue* weights = reader.take("typeWeights")) {
        const JsonArray* array = weights->tryAsArray();
        std::vector<TypeWeightBreakpoint> parsed;
        bool ok = array != nullptr && !array->empty();
        if (array) {
            for (const JsonValue& entry : *array) {
                TypeWeightBreakpoint bp;
                if (!readBreakpoint(entry, bp)) {
                    ok = false;
                    break;
                }
                parsed.push_back(bp);
            }
        }
        if (ok) {
            director.typeWeights = std::move(parsed);
        } else {
            reader.wrongType("typeWeights", "an array of {time, weights[3]} objects");
        }
    }
}

void readPickups(CategoryReader& reader, PickupSpawnConfig& pickups) {
    reader.read("enabled", pickups.enabled);
    reader.read("spawnInterval", pickups.spawnInterval);
    reader.read("maxActive", pickups.maxActive);
    reader.read("healAmount", pickups.healAmount);
    reader.read("radius", pickups.radius);
    reader.read("obstacleClearance", pickups.obstacleClearance);
    reader.read("minSeparation", pickups.minSeparation);
    reader.read("maxSpawnAttempts", pickups.maxSpawnAttempts);
}

void readArchetype(CategoryReader& reader, ZombieArchetype& archetype) {
    reader.read("radius", archetype.radius);
    reader.read("speedMin", archetype.speedMin);
    reader.read("speedMax", archetype.speedMax);
    reader.read("health", archetype.health);
    reader.read("contactDamage", archetype.contactDamage);
    reader.read("attackRange", archetype.attackRange);
    reader.read("attackCooldown", archetype.attackCooldown);
    reader.read("scoreValue", archetype.scoreValue);
    reader.read("mass", archetype.mass);
}

const char* archetypeKey(ZombieType type) {
    switch (type) {
    case ZombieType::Weak: return "weak";
    case ZombieType::Fast: return "fast";
    case ZombieType::Tough: return "tough";
    default: return "unknown";
    }
}

} // namespace

bool SimulationConfig::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR("Failed to load config from file: " + path + " - " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), path);
}

bool SimulationConfig::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse config: " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), "<string>");
}

bool SimulationConfig::apply(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        CONFIG_ERROR("Config root is not a JSON object: " + source);
        return false;
    }

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* category = categoryValue.tryAsObject();
        if (!category) {
            CONFIG_WARN("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        if (categoryName == "clock") {
            CategoryReader reader(categoryName, *category);
            readClock(reader, clock);
        } else if (categoryName == "world") {
            CategoryReader reader(categoryName, *category);
            reader.read("width", worldWidth);
            reader.read("height", worldHeight);
            reader.read("seed", seed);
        } else if (categoryName == "collision") {
            CategoryReader reader(categoryName, *category);
            readCollision(reader, collision);
        } else if (categoryName == "navigation") {
            CategoryReader reader(categoryName, *category);
            readNavigation(reader, navigation);
        } else if (categoryName == "director") {
            CategoryReader reader(categoryName, *category);
            readDirector(reader, director);
        } else if (categoryName == "pickups") {
            CategoryReader reader(categoryName, *category);
            readPickups(reader, pickups);
        } else if (categoryName == "zombies") {
            CategoryReader zombiesReader(categoryName, *category);
            for (size_t k = 0; k < ZOMBIE_TYPE_COUNT; ++k) {
                const char* key = archetypeKey(static_cast<ZombieType>(k));
                const JsonValue* entry = zombiesReader.take(key);
                if (!entry) continue;
                if (const JsonObject* fields = entry->tryAsObject()) {
                    CategoryReader reader(std::string("zombies.") + key, *fields);
                    readArchetype(reader, zombies[k]);
                } else {
                    zombiesReader.wrongType(key, "an object");
                }
            }
        } else {
            CONFIG_WARN("Unknown category '" + categoryName + "' ignored");
        }
    }

    CONFIG_INFO("Loaded simulation config from " + source);
    return true;
}

bool SimulationConfig::validate(std::string& error) const {
    if (!std::isfinite(worldWidth) || !std::isfinite(worldHeight) ||
        worldWidth <= 0.0f || worldHeight <= 0.0f) {
        error = std::format("World size must be positive, got {} x {}", worldWidth, worldHeight);
        return false;
    }

    float largestRadius = 0.0f;
    for (size_t k = 0; k < ZOMBIE_TYPE_COUNT; ++k) {
        const ZombieArchetype& a = zombies[k];
        const char* name = toString(static_cast<ZombieType>(k));
        const bool finite = std::isfinite(a.radius) && std::isfinite(a.speedMin) &&
                            std::isfinite(a.speedMax) && std::isfinite(a.health) &&
                            std::isfinite(a.contactDamage) && std::isfinite(a.attackRange) &&
                            std::isfinite(a.attackCooldown) && std::isfinite(a.mass);
        if (!finite || a.radius <= 0.0f || a.mass <= 0.0f || a.health <= 0.0f) {
            error = std::format("{} zombie needs finite, positive radius, mass and health", name);
            return false;
        }
        if (a.speedMin < 0.0f || a.speedMax < a.speedMin) {
            error = std::format("{} zombie speed range [{}, {}] is invalid", name, a.speedMin, a.speedMax);
            return false;
        }
        if (a.contactDamage < 0.0f || a.attackRange < 0.0f || a.attackCooldown < 0.0f) {
            error = std::format("{} zombie attack values must be >= 0", name);
            return false;
        }
        largestRadius = std::max(largestRadius, a.radius);
    }

    if (director.spawnClearance < largestRadius) {
        error = std::format("director.spawnClearance {} is below the largest zombie radius {}",
                            director.spawnClearance, largestRadius);
        return false;
    }

    // Component constructors own the remaining range checks
    try {
        SimulationClock::validateConfig(clock);
        CollisionWorld collisionCheck(collision);
        Navigation navigationCheck(navigation);
        Director directorCheck(director);
        PickupSpawner pickupCheck(pickups);
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    return true;
}

} // namespace Deadlock

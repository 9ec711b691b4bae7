/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>
#include <optional>
#include <ostream>

namespace Deadlock {

using EntityID = uint64_t;

constexpr EntityID INVALID_ENTITY_ID = 0;

/**
 * @brief Entity type enumeration for fast type checking without RTTI
 *
 * Systems never branch on a class hierarchy; they filter on the capability
 * flags derived from the kind (see EntityTraits).
 */
enum class EntityKind : uint8_t {
    Player = 0,
    Zombie = 1,
    Projectile = 2,
    Pickup = 3,

    COUNT
};

enum class ZombieType : uint8_t {
    Weak = 0,
    Fast = 1,
    Tough = 2,

    COUNT
};

constexpr size_t ZOMBIE_TYPE_COUNT = static_cast<size_t>(ZombieType::COUNT);

/**
 * @brief Capability bit flags
 */
enum Capability : uint8_t {
    CAP_NONE = 0,
    CAP_MOVABLE = 1 << 0,    // Integrated by velocity, pushed by collision
    CAP_DAMAGEABLE = 1 << 1, // Has health, valid projectile target
    CAP_COLLIDABLE = 1 << 2  // Participates in entity-entity overlap tests
};

namespace EntityTraits {

constexpr uint8_t capabilitiesFor(EntityKind kind) noexcept {
    switch (kind) {
    case EntityKind::Player:
    case EntityKind::Zombie:
        return CAP_MOVABLE | CAP_DAMAGEABLE | CAP_COLLIDABLE;
    case EntityKind::Projectile:
        return CAP_MOVABLE;
    case EntityKind::Pickup:
        return CAP_COLLIDABLE;
    default:
        return CAP_NONE;
    }
}

constexpr bool hasHealth(EntityKind kind) noexcept {
    return (capabilitiesFor(kind) & CAP_DAMAGEABLE) != 0;
}

/// Solid bodies push each other apart and are clamped out of obstacles
constexpr bool isSolidBody(EntityKind kind) noexcept {
    const uint8_t caps = capabilitiesFor(kind);
    return (caps & CAP_MOVABLE) && (caps & CAP_COLLIDABLE);
}

} // namespace EntityTraits

const char* toString(EntityKind kind);
const char* toString(ZombieType type);

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    return os << toString(kind);
}

inline std::ostream& operator<<(std::ostream& os, ZombieType type) {
    return os << toString(type);
}

struct ZombieData {
    ZombieType type{ZombieType::Weak};
    float speed{60.0f};          // px/s
    float contactDamage{10.0f};
    float attackRange{8.0f};     // surface-to-surface distance
    float attackCooldown{1.0f};  // seconds
    int scoreValue{10};
};

struct ProjectileData {
    EntityID owner{INVALID_ENTITY_ID};
    float damage{25.0f};
    float remainingRange{1200.0f}; // px left before expiry
    float explosionRadius{0.0f};   // 0 = not explosive
};

struct PickupData {
    float healAmount{25.0f};
};

/**
 * @brief One record for every simulated object.
 *
 * The kind discriminant selects which payload is meaningful. Entities are
 * owned by the EntityRegistry and are never moved between kinds.
 */
struct Entity {
    EntityID id{INVALID_ENTITY_ID};
    EntityKind kind{EntityKind::Zombie};
    uint8_t capabilities{CAP_NONE};

    Vector2D position{0.0f, 0.0f};
    Vector2D previousPosition{0.0f, 0.0f}; // position at start of the tick
    Vector2D velocity{0.0f, 0.0f};
    float radius{12.0f};
    float mass{1.0f};

    std::optional<float> health;
    std::optional<float> maxHealth;
    bool alive{true};

    ZombieData zombie{};
    ProjectileData projectile{};
    PickupData pickup{};

    bool has(Capability cap) const { return (capabilities & cap) != 0; }
    bool isSolid() const { return alive && EntityTraits::isSolidBody(kind); }
};

} // namespace Deadlock

#endif // ENTITY_HPP

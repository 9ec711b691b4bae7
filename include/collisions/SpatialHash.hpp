/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_HASH_HPP
#define SPATIAL_HASH_HPP

#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"
#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace Deadlock {

/**
 * @brief Uniform grid bucketing ids by cell.
 *
 * Two insertion modes share the same cells:
 *  - insertPoint() files an id under the single cell holding its center. Used
 *    for dynamic entities, rebuilt from scratch every tick. With a cell size
 *    of at least the largest diameter, any overlapping pair lies within each
 *    other's 3x3 neighbourhood (queryNeighbors).
 *  - insert() files an id under every cell its bounds overlap. Used for the
 *    static obstacle set, built once.
 *
 * Query output order is deterministic: cells are walked row-major and each
 * bucket keeps insertion order.
 */
class SpatialHash {
public:
    struct CellCoord {
        int x;
        int y;
    };

    explicit SpatialHash(float cellSize = 64.0f);

    void setCellSize(float cellSize);
    float getCellSize() const { return m_cellSize; }

    void insertPoint(EntityID id, const Vector2D& position);
    void insert(EntityID id, const AABB& aabb);
    void clear();

    // Ids bucketed in the 3x3 block of cells around position's cell
    void queryNeighbors(const Vector2D& position, std::vector<EntityID>& out) const;

    // Ids bucketed in any cell overlapping area, deduplicated
    void query(const AABB& area, std::vector<EntityID>& out) const;

    CellCoord cellOf(const Vector2D& position) const;
    size_t cellCount() const { return m_cells.size(); }
    size_t size() const { return m_count; }

private:
    struct CellCoordHash {
        size_t operator()(const CellCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.y);
        }
    };
    struct CellCoordEq {
        bool operator()(const CellCoord& a, const CellCoord& b) const noexcept {
            return a.x == b.x && a.y == b.y;
        }
    };

    // Typical cell holds a handful of bodies
    using CellVector = boost::container::small_vector<EntityID, 8>;

    void forEachOverlappingCell(const AABB& aabb, const std::function<void(CellCoord)>& fn) const;

    float m_cellSize{64.0f};
    size_t m_count{0};
    std::unordered_map<CellCoord, CellVector, CellCoordHash, CellCoordEq> m_cells;
};

} // namespace Deadlock

#endif // SPATIAL_HASH_HPP

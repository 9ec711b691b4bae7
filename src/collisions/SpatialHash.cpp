/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include <algorithm>
#include <cmath>     // std::floor
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace Deadlock {

SpatialHash::SpatialHash(float cellSize) {
    setCellSize(cellSize);
}

void SpatialHash::setCellSize(float cellSize) {
    if (!std::isfinite(cellSize) || cellSize <= 0.0f) {
        throw std::invalid_argument(std::format("SpatialHash cell size must be positive, got {}", cellSize));
    }
    if (cellSize != m_cellSize) {
        clear();
        m_cellSize = cellSize;
    }
}

SpatialHash::CellCoord SpatialHash::cellOf(const Vector2D& position) const {
    return CellCoord{static_cast<int>(std::floor(position.getX() / m_cellSize)),
                     static_cast<int>(std::floor(position.getY() / m_cellSize))};
}

void SpatialHash::insertPoint(EntityID id, const Vector2D& position) {
    m_cells[cellOf(position)].push_back(id);
    ++m_count;
}

void SpatialHash::insert(EntityID id, const AABB& aabb) {
    forEachOverlappingCell(aabb, [&](CellCoord c) { m_cells[c].push_back(id); });
    ++m_count;
}

void SpatialHash::clear() {
    m_cells.clear();
    m_count = 0;
}

void SpatialHash::queryNeighbors(const Vector2D& position, std::vector<EntityID>& out) const {
    out.clear();
    const CellCoord center = cellOf(position);
    for (int y = center.y - 1; y <= center.y + 1; ++y) {
        for (int x = center.x - 1; x <= center.x + 1; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it == m_cells.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
}

void SpatialHash::query(const AABB& area, std::vector<EntityID>& out) const {
    out.clear();

    // Multi-cell inserts can appear in several overlapped cells
    thread_local std::unordered_set<EntityID> seenIds;
    seenIds.clear();

    const int minX = static_cast<int>(std::floor(area.left() / m_cellSize));
    const int maxX = static_cast<int>(std::floor(area.right() / m_cellSize));
    const int minY = static_cast<int>(std::floor(area.top() / m_cellSize));
    const int maxY = static_cast<int>(std::floor(area.bottom() / m_cellSize));

    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            auto it = m_cells.find(CellCoord{x, y});
            if (it == m_cells.end()) continue;

            for (EntityID id : it->second) {
                if (seenIds.emplace(id).second) {
                    out.push_back(id);
                }
            }
        }
    }
}

void SpatialHash::forEachOverlappingCell(const AABB& aabb, const std::function<void(CellCoord)>& fn) const {
    const int minX = static_cast<int>(std::floor(aabb.left() / m_cellSize));
    const int maxX = static_cast<int>(std::floor(aabb.right() / m_cellSize));
    const int minY = static_cast<int>(std::floor(aabb.top() / m_cellSize));
    const int maxY = static_cast<int>(std::floor(aabb.bottom() / m_cellSize));
    for (int y = minY; y <= maxY; ++y) {
        for (int x = minX; x <= maxX; ++x) {
            fn(CellCoord{x, y});
        }
    }
}

} // namespace Deadlock

#include "orthoplan/geometry/GridIndex.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Orthoplan::Engine {

namespace {
    const std::vector<size_t> EMPTY_CELL;
}

GridIndex::GridIndex(double cellSize) : cellSize_(cellSize) {
    if (!(cellSize_ > 0.0) || !std::isfinite(cellSize_)) {
        throw std::invalid_argument("GridIndex: cell size must be a positive finite number");
    }
}

GridKey GridIndex::KeyFor(const Point2D& point) const {
    GridKey key;
    key.x = static_cast<int64_t>(Geometry::RoundHalfUp(point.x / cellSize_));
    key.y = static_cast<int64_t>(Geometry::RoundHalfUp(point.y / cellSize_));
    return key;
}

Point2D GridIndex::CellPoint(const GridKey& key) const {
    return Point2D(static_cast<double>(key.x) * cellSize_, static_cast<double>(key.y) * cellSize_);
}

size_t GridIndex::Insert(const GridEntry& entry) {
    size_t id = entries_.size();
    entries_.push_back(entry);

    GridKey key = KeyFor(entry.point);
    auto& cell = cells_[key];
    if (cell.empty()) {
        keyOrder_.push_back(key);
    }
    cell.push_back(id);
    return id;
}

const GridEntry& GridIndex::GetEntry(size_t entryId) const {
    return entries_.at(entryId);
}

size_t GridIndex::GetEntryCount() const {
    return entries_.size();
}

const std::vector<GridKey>& GridIndex::GetKeys() const {
    return keyOrder_;
}

const std::vector<size_t>& GridIndex::GetCell(const GridKey& key) const {
    auto it = cells_.find(key);
    return it != cells_.end() ? it->second : EMPTY_CELL;
}

std::vector<size_t> GridIndex::Query(const Point2D& point, double radius) const {
    std::vector<size_t> result;
    if (!Geometry::IsFinite(point) || !(radius >= 0.0)) {
        return result;
    }

    // Rounding moves each coordinate by at most half a cell, so one extra ring suffices.
    const double reach = std::ceil(radius / cellSize_) + 1.0;
    const GridKey center = KeyFor(point);
    const double ringCells = (2.0 * reach + 1.0) * (2.0 * reach + 1.0);

    auto collect = [&](const std::vector<size_t>& ids) {
        for (size_t id : ids) {
            if (Geometry::Distance(point, entries_[id].point) <= radius) {
                result.push_back(id);
            }
        }
    };

    if (ringCells > static_cast<double>(cells_.size())) {
        // Sparse index: walking the occupied cells is cheaper than walking the ring.
        for (const auto& [key, ids] : cells_) {
            if (std::abs(static_cast<double>(key.x - center.x)) <= reach &&
                std::abs(static_cast<double>(key.y - center.y)) <= reach) {
                collect(ids);
            }
        }
    } else {
        const int64_t r = static_cast<int64_t>(reach);
        for (int64_t dx = -r; dx <= r; ++dx) {
            for (int64_t dy = -r; dy <= r; ++dy) {
                auto it = cells_.find(GridKey{center.x + dx, center.y + dy});
                if (it != cells_.end()) {
                    collect(it->second);
                }
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace Orthoplan::Engine

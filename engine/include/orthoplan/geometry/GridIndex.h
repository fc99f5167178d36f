#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    // Integer cell coordinate. Two points share a key when they round to the same cell.
    struct GridKey {
        int64_t x = 0;
        int64_t y = 0;

        bool operator<(const GridKey& other) const {
            if (x != other.x) return x < other.x;
            return y < other.y;
        }
        bool operator==(const GridKey& other) const { return x == other.x && y == other.y; }
        bool operator!=(const GridKey& other) const { return !(*this == other); }
    };

    struct GridEntry {
        Point2D point{0.0};
        size_t owner = 0;    // index of the segment this endpoint belongs to
        bool isStart = true; // which end of the owner
    };

    // Bucket index over segment endpoints. Cells are cellSize wide and keyed by
    // round(coordinate / cellSize). Iteration orders (keys, query results) follow
    // insertion order so callers stay deterministic.
    class GridIndex {
    public:
        explicit GridIndex(double cellSize = 1.0);

        GridKey KeyFor(const Point2D& point) const;
        // The canonical point of a cell (the key scaled back to world units).
        Point2D CellPoint(const GridKey& key) const;

        size_t Insert(const GridEntry& entry);

        const GridEntry& GetEntry(size_t entryId) const;
        size_t GetEntryCount() const;
        const std::vector<GridKey>& GetKeys() const; // in first-insertion order
        const std::vector<size_t>& GetCell(const GridKey& key) const;

        // Ids of all entries whose point is within radius of the given point,
        // sorted by insertion order.
        std::vector<size_t> Query(const Point2D& point, double radius) const;

        double GetCellSize() const { return cellSize_; }

    private:
        double cellSize_;
        std::vector<GridEntry> entries_;
        std::vector<GridKey> keyOrder_;
        std::map<GridKey, std::vector<size_t>> cells_;
    };

} // namespace Orthoplan::Engine

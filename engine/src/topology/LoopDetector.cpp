#include "orthoplan/topology/LoopDetector.h"
#include "orthoplan/Diagnostics.h"
#include "orthoplan/geometry/GridIndex.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <fmt/format.h>
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include <utility>

namespace Orthoplan::Engine {

namespace {

    constexpr size_t NO_NODE = std::numeric_limits<size_t>::max();

    struct GraphEdge {
        size_t node;
        size_t segment;
    };

    struct GraphNode {
        Point2D point{0.0};
        std::vector<GraphEdge> edges;
    };

    // Collapses endpoints onto the tolerance grid; nodes are numbered in first-seen order.
    std::vector<GraphNode> BuildEndpointGraph(const std::vector<Segment>& segments, double tolerance) {
        GridIndex grid(tolerance);
        std::map<GridKey, size_t> nodeIds;
        std::vector<GraphNode> nodes;

        auto nodeFor = [&](const Point2D& p) {
            GridKey key = grid.KeyFor(p);
            auto it = nodeIds.find(key);
            if (it != nodeIds.end()) return it->second;
            size_t id = nodes.size();
            nodeIds.emplace(key, id);
            nodes.push_back({ grid.CellPoint(key), {} });
            return id;
        };

        for (size_t i = 0; i < segments.size(); ++i) {
            const Segment& s = segments[i];
            if (!Geometry::IsValidSegment(s)) continue;
            size_t a = nodeFor(s.start);
            size_t b = nodeFor(s.end);
            if (a == b) continue; // shorter than the grid; no edge
            nodes[a].edges.push_back({ b, i });
            nodes[b].edges.push_back({ a, i });
        }
        return nodes;
    }

    class SegmentGraphSearch {
    public:
        SegmentGraphSearch(const std::vector<GraphNode>& nodes, const std::vector<bool>& usedSegments,
                           const LoopDetectionOptions& options)
            : nodes_(nodes), usedSegments_(usedSegments), options_(options),
              onPath_(nodes.size(), false), segmentOnPath_(usedSegments.size(), false) {}

        bool Run(size_t start) {
            pathNodes_.assign(1, start);
            pathSegments_.clear();
            onPath_[start] = true;
            expansions_ = 0;
            bool found = Visit(start, NO_NODE, 1);
            onPath_[start] = false;
            return found;
        }

        const std::vector<size_t>& GetPathNodes() const { return pathNodes_; }
        const std::vector<size_t>& GetPathSegments() const { return pathSegments_; }
        bool WasTruncated() const { return truncated_; }

    private:
        bool Visit(size_t current, size_t previous, int depth) {
            if (depth > options_.maxDepth || expansions_ >= options_.maxExpansions) {
                truncated_ = true;
                return false;
            }
            ++expansions_;

            const Point2D& startPoint = nodes_[pathNodes_.front()].point;
            for (const GraphEdge& edge : nodes_[current].edges) {
                if (usedSegments_[edge.segment] || segmentOnPath_[edge.segment]) continue;
                if (edge.node == previous) continue;

                if (pathNodes_.size() >= 3 && Geometry::Distance(nodes_[edge.node].point, startPoint) <= options_.maxGap) {
                    pathSegments_.push_back(edge.segment);
                    return true;
                }
                if (onPath_[edge.node]) continue;

                pathNodes_.push_back(edge.node);
                pathSegments_.push_back(edge.segment);
                onPath_[edge.node] = true;
                segmentOnPath_[edge.segment] = true;

                if (Visit(edge.node, current, depth + 1)) return true;

                onPath_[edge.node] = false;
                segmentOnPath_[edge.segment] = false;
                pathSegments_.pop_back();
                pathNodes_.pop_back();
            }
            return false;
        }

        const std::vector<GraphNode>& nodes_;
        const std::vector<bool>& usedSegments_;
        const LoopDetectionOptions& options_;
        std::vector<bool> onPath_;
        std::vector<bool> segmentOnPath_;
        std::vector<size_t> pathNodes_;
        std::vector<size_t> pathSegments_;
        size_t expansions_ = 0;
        bool truncated_ = false;
    };

    std::vector<Point2D> CloseRing(std::vector<Point2D> points) {
        if (!points.empty()) points.push_back(points.front());
        return points;
    }

} // anonymous namespace

// --- SegmentGraphLoopStrategy ---

SegmentGraphLoopStrategy::SegmentGraphLoopStrategy(const LoopDetectionOptions& options) : options_(options) {}

std::vector<Room> SegmentGraphLoopStrategy::FindLoops(const std::vector<Segment>& segments, DiagnosticLog& diagnostics) const {
    std::vector<Room> rooms;
    if (segments.size() < 3) return rooms;

    const std::vector<GraphNode> nodes = BuildEndpointGraph(segments, options_.gridTolerance);
    std::vector<bool> usedSegments(segments.size(), false);
    std::vector<bool> visitedNodes(nodes.size(), false);
    size_t truncatedStarts = 0;

    for (size_t start = 0; start < nodes.size(); ++start) {
        if (visitedNodes[start]) continue;
        visitedNodes[start] = true;

        SegmentGraphSearch search(nodes, usedSegments, options_);
        bool found = search.Run(start);
        if (search.WasTruncated()) ++truncatedStarts;
        if (!found) continue;

        std::vector<Point2D> ring;
        for (size_t node : search.GetPathNodes()) {
            ring.push_back(nodes[node].point);
            visitedNodes[node] = true;
        }
        for (size_t segment : search.GetPathSegments()) {
            usedSegments[segment] = true;
        }

        double area = Geometry::PolygonArea(ring);
        if (area >= options_.minArea) {
            rooms.push_back({ CloseRing(std::move(ring)), area });
        }
    }

    if (truncatedStarts > 0) {
        diagnostics.Warn(DiagnosticCode::LOOP_SEARCH_TRUNCATED,
            fmt::format("loop search from {} start node(s) stopped at depth {} or {} expansions",
                        truncatedStarts, options_.maxDepth, options_.maxExpansions));
    }
    return rooms;
}

// --- WallCycleLoopStrategy ---

namespace {

    class WallCycleSearch {
    public:
        WallCycleSearch(const GridIndex& grid, const std::map<GridKey, std::vector<Point2D>>& adjacency,
                        const LoopDetectionOptions& options)
            : grid_(grid), adjacency_(adjacency), options_(options) {}

        std::optional<std::vector<Point2D>> Find(const GridKey& key) {
            std::vector<Point2D> path;
            return Visit(key, path);
        }

        bool IsVisited(const GridKey& key) const { return visited_.count(key) > 0; }
        bool WasTruncated() const { return truncated_; }

    private:
        std::optional<std::vector<Point2D>> Visit(const GridKey& key, std::vector<Point2D>& path) {
            const Point2D current = grid_.CellPoint(key);
            if (path.size() >= 3 && Geometry::Distance(current, path.front()) <= options_.gridTolerance) {
                return path;
            }
            if (!path.empty()) {
                if (visited_.count(key) > 0 && path.size() > 1) return std::nullopt;
                visited_.insert(key);
            }
            if (static_cast<int>(path.size()) >= options_.maxDepth) {
                truncated_ = true;
                return std::nullopt;
            }

            auto it = adjacency_.find(key);
            if (it == adjacency_.end()) return std::nullopt;

            for (const Point2D& neighbor : it->second) {
                if (!path.empty() && Geometry::Distance(neighbor, path.back()) <= options_.gridTolerance) continue;

                path.push_back(current);
                std::optional<std::vector<Point2D>> cycle = Visit(grid_.KeyFor(neighbor), path);
                path.pop_back();
                if (cycle) return cycle;
            }
            return std::nullopt;
        }

        const GridIndex& grid_;
        const std::map<GridKey, std::vector<Point2D>>& adjacency_;
        const LoopDetectionOptions& options_;
        std::set<GridKey> visited_;
        bool truncated_ = false;
    };

} // anonymous namespace

WallCycleLoopStrategy::WallCycleLoopStrategy(const LoopDetectionOptions& options) : options_(options) {}

std::vector<Room> WallCycleLoopStrategy::FindLoops(const std::vector<Segment>& segments, DiagnosticLog& diagnostics) const {
    std::vector<Room> loops;
    if (segments.size() < 3) return loops;

    GridIndex grid(options_.gridTolerance);
    std::map<GridKey, std::vector<Point2D>> adjacency;
    std::vector<GridKey> keyOrder;

    auto link = [&](const GridKey& from, const GridKey& to) {
        auto it = adjacency.find(from);
        if (it == adjacency.end()) {
            it = adjacency.emplace(from, std::vector<Point2D>{}).first;
            keyOrder.push_back(from);
        }
        it->second.push_back(grid.CellPoint(to));
    };

    for (const Segment& wall : segments) {
        if (!Geometry::IsFinite(wall.start) || !Geometry::IsFinite(wall.end)) continue;
        GridKey a = grid.KeyFor(wall.start);
        GridKey b = grid.KeyFor(wall.end);
        link(a, b);
        link(b, a);
    }

    WallCycleSearch search(grid, adjacency, options_);
    for (const GridKey& start : keyOrder) {
        if (search.IsVisited(start)) continue;

        std::optional<std::vector<Point2D>> cycle = search.Find(start);
        if (!cycle || cycle->size() < 3) continue;

        double area = Geometry::PolygonArea(*cycle);
        if (area >= options_.minArea) {
            loops.push_back({ CloseRing(std::move(*cycle)), area });
        }
    }

    if (search.WasTruncated()) {
        diagnostics.Warn(DiagnosticCode::LOOP_SEARCH_TRUNCATED,
            fmt::format("wall cycle search stopped at depth {}", options_.maxDepth));
    }
    return loops;
}

// --- LoopDetector ---

LoopDetector::LoopDetector(LoopPolicy policy, const LoopDetectionOptions& options)
    : policy_(policy), options_(options) {
    if (policy_ == LoopPolicy::LARGEST_LOOP_ONLY) {
        strategy_ = std::make_unique<WallCycleLoopStrategy>(options_);
    } else {
        strategy_ = std::make_unique<SegmentGraphLoopStrategy>(options_);
    }
}

LoopDetector::~LoopDetector() = default;

std::vector<Room> LoopDetector::Detect(const std::vector<Segment>& segments, DiagnosticLog* diagnostics) const {
    DiagnosticLog localLog;
    DiagnosticLog& log = diagnostics ? *diagnostics : localLog;

    std::vector<Room> loops = strategy_->FindLoops(segments, log);
    if (policy_ != LoopPolicy::LARGEST_LOOP_ONLY) {
        return loops;
    }

    std::vector<Room> largest;
    if (std::optional<Room> best = SelectLargestLoop(loops)) {
        largest.push_back(std::move(*best));
    }
    return largest;
}

std::vector<Room> DetectRooms(const std::vector<Segment>& lines, double minArea, double maxGap, DiagnosticLog* diagnostics) {
    LoopDetectionOptions options;
    options.minArea = minArea;
    options.maxGap = maxGap;
    return LoopDetector(LoopPolicy::ALL_LOOPS, options).Detect(lines, diagnostics);
}

std::vector<Room> FindClosedLoops(const std::vector<Wall>& walls, double minArea, double tolerance) {
    std::vector<Segment> segments;
    segments.reserve(walls.size());
    for (const Wall& wall : walls) {
        segments.emplace_back(wall.start, wall.end, wall.thickness);
    }

    LoopDetectionOptions options;
    options.minArea = minArea;
    options.gridTolerance = tolerance;
    options.maxGap = tolerance;

    DiagnosticLog log;
    return WallCycleLoopStrategy(options).FindLoops(segments, log);
}

std::optional<Room> SelectLargestLoop(const std::vector<Room>& loops) {
    std::optional<Room> largest;
    double largestArea = 0.0;
    for (const Room& loop : loops) {
        if (loop.area > largestArea) {
            largestArea = loop.area;
            largest = loop;
        }
    }
    return largest;
}

} // namespace Orthoplan::Engine

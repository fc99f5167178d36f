#include "orthoplan/CleanupPipeline.h"
#include "orthoplan/geometry/Geometry2D.h"
#include "orthoplan/topology/ColinearMerger.h"
#include "orthoplan/topology/GapBridger.h"
#include "orthoplan/topology/LoopDetector.h"
#include "orthoplan/topology/OrthoSnapper.h"
#include "orthoplan/topology/ParallelMerger.h"
#include "orthoplan/topology/WallExtractor.h"
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <type_traits>

namespace Orthoplan::Engine {

namespace {

    std::string FormatPoint(const Point2D& p) {
        return fmt::format("({}, {})", p.x, p.y);
    }

    void AppendRooms(std::string& out, const char* label, const std::vector<Room>& rooms) {
        fmt::format_to(std::back_inserter(out), "{}: {}\n", label, rooms.size());
        for (size_t i = 0; i < rooms.size(); ++i) {
            fmt::format_to(std::back_inserter(out), "  [{}] area={} points=", i, rooms[i].area);
            for (size_t j = 0; j < rooms[i].points.size(); ++j) {
                if (j > 0) out += ' ';
                out += FormatPoint(rooms[i].points[j]);
            }
            out += '\n';
        }
    }

    void AppendDiagnostics(std::string& out, const std::vector<Diagnostic>& diagnostics) {
        fmt::format_to(std::back_inserter(out), "diagnostics: {}\n", diagnostics.size());
        for (const Diagnostic& d : diagnostics) {
            fmt::format_to(std::back_inserter(out), "  {} {}: {}\n",
                           d.severity == DiagnosticSeverity::WARNING ? "warning" : "info", ToString(d.code), d.message);
        }
    }

    std::vector<Segment> DropInvalid(const std::vector<Segment>& lines, DiagnosticLog& log) {
        std::vector<Segment> valid;
        valid.reserve(lines.size());
        std::copy_if(lines.begin(), lines.end(), std::back_inserter(valid), Geometry::IsValidSegment);
        if (valid.size() < lines.size()) {
            log.Info(DiagnosticCode::INVALID_INPUT_DROPPED,
                     fmt::format("dropped {} invalid segment(s) of {}", lines.size() - valid.size(), lines.size()));
        }
        return valid;
    }

} // anonymous namespace

CleanupResult CleanupGeometry(const std::vector<Segment>& lines, const CleanupOptions& options) {
    CleanupResult result;
    if (lines.empty()) {
        return result;
    }

    DiagnosticLog log(options.onDiagnostic);
    std::vector<Segment> cleaned = DropInvalid(lines, log);
    if (options.verbose) {
        fmt::print("Pipeline: {} input segments, {} valid\n", lines.size(), cleaned.size());
    }

    SnapOptions snap;
    snap.toleranceDeg = options.snapToleranceDeg;
    snap.use45Deg = options.use45Deg;
    snap.snapToGrid = options.snapToGrid;
    snap.gridSize = options.gridSize;
    cleaned = SnapLines(cleaned, snap);
    if (options.verbose) fmt::print("Pipeline: Snapped {} segments\n", cleaned.size());

    if (cleaned.size() > 1) {
        ParallelMergeOptions parallel;
        parallel.distanceTolerance = options.mergeDistance;
        cleaned = MergeParallel(cleaned, parallel, &log);
        if (options.verbose) fmt::print("Pipeline: {} segments after parallel merge\n", cleaned.size());
    }

    if (cleaned.size() > 1) {
        ColinearMergeOptions colinear;
        colinear.distance = options.mergeDistance;
        colinear.angleTolerance = options.colinearAngleTolerance;
        cleaned = MergeColinearSegments(cleaned, colinear);
        if (options.verbose) fmt::print("Pipeline: {} segments after colinear merge\n", cleaned.size());
    }

    if (cleaned.size() > 1) {
        GapBridgeOptions bridge;
        bridge.maxGap = options.maxGap;
        cleaned = BridgeGaps(cleaned, bridge);
        if (options.verbose) fmt::print("Pipeline: {} segments after gap bridging\n", cleaned.size());
    }

    std::vector<Room> rooms = DetectRooms(cleaned, options.minRoomArea, options.roomDetectionGap, &log);
    const size_t detected = rooms.size();
    rooms.erase(std::remove_if(rooms.begin(), rooms.end(),
                               [&](const Room& room) { return room.area < options.minArea; }),
                rooms.end());
    if (options.verbose) {
        fmt::print("Pipeline: Detected {} rooms, {} kept after area filter\n", detected, rooms.size());
    }

    result.rooms = rooms;
    result.polygons = std::move(rooms);
    result.lines = std::move(cleaned);
    result.diagnostics = log.GetEntries();
    return result;
}

std::vector<Segment> PolylinesToSegments(const std::vector<Polyline>& polylines, double closedTolerance) {
    std::vector<Segment> lines;
    for (const Polyline& polyline : polylines) {
        if (polyline.size() < 2) continue;

        for (size_t i = 0; i + 1 < polyline.size(); ++i) {
            lines.emplace_back(polyline[i], polyline[i + 1]);
        }

        bool closed = Geometry::Distance(polyline.front(), polyline.back()) < closedTolerance;
        if (!closed && polyline.size() > 2) {
            lines.emplace_back(polyline.back(), polyline.front());
        }
    }
    return lines;
}

CleanupResult CleanupFromPolylines(const std::vector<Polyline>& polylines, const CleanupOptions& options) {
    if (polylines.empty()) {
        return {};
    }
    return CleanupGeometry(PolylinesToSegments(polylines, options.closedTolerance), options);
}

CleanupResult Cleanup(const GeometryInput& input, const CleanupOptions& options) {
    return std::visit([&options](const auto& geometry) -> CleanupResult {
        using T = std::decay_t<decltype(geometry)>;
        if constexpr (std::is_same_v<T, SegmentInput>) {
            return CleanupGeometry(geometry.segments, options);
        } else {
            return CleanupFromPolylines(geometry.polylines, options);
        }
    }, input);
}

Bounds ComputeBounds(const std::vector<Wall>& walls) {
    Bounds bounds;
    if (walls.empty()) return bounds;

    bounds.minX = bounds.maxX = walls.front().start.x;
    bounds.minY = bounds.maxY = walls.front().start.y;
    for (const Wall& wall : walls) {
        for (const Point2D& p : { wall.start, wall.end }) {
            bounds.minX = std::min(bounds.minX, p.x);
            bounds.maxX = std::max(bounds.maxX, p.x);
            bounds.minY = std::min(bounds.minY, p.y);
            bounds.maxY = std::max(bounds.maxY, p.y);
        }
    }
    return bounds;
}

Topology ExtractTopology(const GeometryInput& input, const TopologyOptions& options) {
    CleanupResult cleaned = Cleanup(input, options.cleanup);

    WallExtractionOptions extraction;
    extraction.minWallLength = options.minWallLength;
    extraction.wallThickness = options.wallThickness;
    extraction.openingThreshold = options.openingThreshold;
    WallGeometry geometry = ExtractWallGeometry(cleaned.lines, extraction);

    WallClassificationOptions classification;
    classification.exteriorThickness = options.exteriorThickness;
    classification.interiorThickness = options.interiorThickness;

    Topology topology;
    topology.walls = ClassifyWalls(geometry.walls, classification);
    topology.rooms = std::move(cleaned.rooms);
    topology.openings = std::move(geometry.openings);
    topology.meta.scale = options.pxToMeters;
    topology.meta.bounds = ComputeBounds(topology.walls);
    topology.diagnostics = std::move(cleaned.diagnostics);

    if (options.cleanup.verbose) {
        fmt::print("Pipeline: Topology has {} walls, {} rooms, {} openings\n",
                   topology.walls.size(), topology.rooms.size(), topology.openings.size());
    }
    return topology;
}

std::string FormatCleanupResult(const CleanupResult& result) {
    std::string out;
    AppendRooms(out, "rooms", result.rooms);

    fmt::format_to(std::back_inserter(out), "lines: {}\n", result.lines.size());
    for (size_t i = 0; i < result.lines.size(); ++i) {
        const Segment& line = result.lines[i];
        fmt::format_to(std::back_inserter(out), "  [{}] {} -> {}", i, FormatPoint(line.start), FormatPoint(line.end));
        if (line.thickness) {
            fmt::format_to(std::back_inserter(out), " thickness={}", *line.thickness);
        }
        out += '\n';
    }

    AppendRooms(out, "polygons", result.polygons);
    AppendDiagnostics(out, result.diagnostics);
    return out;
}

std::string FormatTopology(const Topology& topology) {
    std::string out;

    fmt::format_to(std::back_inserter(out), "walls: {}\n", topology.walls.size());
    for (size_t i = 0; i < topology.walls.size(); ++i) {
        const Wall& wall = topology.walls[i];
        fmt::format_to(std::back_inserter(out), "  [{}] {} -> {} thickness={} type={}\n", i,
                       FormatPoint(wall.start), FormatPoint(wall.end), wall.thickness, ToString(wall.type));
    }

    AppendRooms(out, "rooms", topology.rooms);

    fmt::format_to(std::back_inserter(out), "openings: {}\n", topology.openings.size());
    for (size_t i = 0; i < topology.openings.size(); ++i) {
        const Opening& opening = topology.openings[i];
        fmt::format_to(std::back_inserter(out), "  [{}] {} -> {} position={} width={} type={}\n", i,
                       FormatPoint(opening.start), FormatPoint(opening.end), FormatPoint(opening.position),
                       opening.width, ToString(opening.type));
    }

    const Bounds& b = topology.meta.bounds;
    fmt::format_to(std::back_inserter(out), "meta: scale={} bounds=[{}, {}] x [{}, {}]\n",
                   topology.meta.scale, b.minX, b.maxX, b.minY, b.maxY);
    AppendDiagnostics(out, topology.diagnostics);
    return out;
}

} // namespace Orthoplan::Engine

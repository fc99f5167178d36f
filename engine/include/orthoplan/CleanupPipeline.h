#pragma once

#include <string>
#include <variant>
#include <vector>
#include "orthoplan/architecture.h"
#include "orthoplan/Diagnostics.h"
#include "orthoplan/engine_export.h"
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct CleanupOptions {
        double minArea = 50.0;                // rooms below this are filtered from the result

        double snapToleranceDeg = 5.0;
        bool use45Deg = false;
        bool snapToGrid = false;
        double gridSize = 10.0;

        double mergeDistance = 10.0;          // parallel and colinear merge distance
        double colinearAngleTolerance = 0.01;

        double maxGap = 5.0;

        double minRoomArea = 100.0;
        double roomDetectionGap = 5.0;

        double closedTolerance = 5.0;         // polyline first/last distance that counts as closed

        bool verbose = false;                 // print "Pipeline: ..." progress lines
        DiagnosticLog::Callback onDiagnostic; // receives every diagnostic as it is raised
    };

    struct CleanupResult {
        std::vector<Room> rooms;
        std::vector<Segment> lines;
        std::vector<Room> polygons;          // same as rooms
        std::vector<Diagnostic> diagnostics;
    };

    struct SegmentInput {
        std::vector<Segment> segments;
    };

    struct PolylineInput {
        std::vector<Polyline> polylines;
    };

    using GeometryInput = std::variant<SegmentInput, PolylineInput>;

    struct TopologyOptions {
        CleanupOptions cleanup;
        double minWallLength = 10.0;
        double wallThickness = 2.0;
        double openingThreshold = 10.0;
        double exteriorThickness = 6.0;
        double interiorThickness = 2.0;
        double pxToMeters = 0.01;
    };

    struct Bounds {
        double minX = 0.0;
        double maxX = 0.0;
        double minY = 0.0;
        double maxY = 0.0;
    };

    struct TopologyMeta {
        double scale = 0.01;
        Bounds bounds;
    };

    struct Topology {
        std::vector<Wall> walls;
        std::vector<Room> rooms;
        std::vector<Opening> openings;
        TopologyMeta meta;
        std::vector<Diagnostic> diagnostics;
    };

    // Snap -> merge parallel -> merge colinear -> bridge gaps -> detect rooms -> filter by area.
    // Invalid segments are dropped on entry and reported as INVALID_INPUT_DROPPED.
    ORTHOPLAN_ENGINE_API CleanupResult CleanupGeometry(const std::vector<Segment>& lines, const CleanupOptions& options = {});

    // Splits polylines into segments (closing open ones with more than two points) and cleans them.
    ORTHOPLAN_ENGINE_API CleanupResult CleanupFromPolylines(const std::vector<Polyline>& polylines, const CleanupOptions& options = {});

    ORTHOPLAN_ENGINE_API CleanupResult Cleanup(const GeometryInput& input, const CleanupOptions& options = {});

    ORTHOPLAN_ENGINE_API Topology ExtractTopology(const GeometryInput& input, const TopologyOptions& options = {});

    // Segments of a polyline, plus the closing one when it is open and has more than two points.
    std::vector<Segment> PolylinesToSegments(const std::vector<Polyline>& polylines, double closedTolerance = 5.0);

    Bounds ComputeBounds(const std::vector<Wall>& walls);

    ORTHOPLAN_ENGINE_API std::string FormatCleanupResult(const CleanupResult& result);
    ORTHOPLAN_ENGINE_API std::string FormatTopology(const Topology& topology);

} // namespace Orthoplan::Engine

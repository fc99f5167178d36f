#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct ValidationOptions {
        double minWallLength = 20.0;
        double minStraightness = 0.8;   // direct distance / path length
        size_t minWalls = 3;
        size_t minClosedLoops = 1;
        double closureTolerance = 5.0;
    };

    struct ValidationStats {
        size_t polylineCount = 0;
        size_t segmentCount = 0;
        size_t wallCount = 0;
        size_t closedLoops = 0;
        double averageWallLength = 0.0;
        double minWallLength = 0.0;
        double maxWallLength = 0.0;
    };

    struct ValidationResult {
        bool valid = false;
        std::optional<std::string> error; // all failed checks, joined with "; "
        ValidationStats stats;
    };

    // A wall candidate pulled out of a polyline.
    struct CandidateSegment {
        Point2D start{0.0};
        Point2D end{0.0};
        double length = 0.0;
        double straightness = 1.0;
    };

    // 1.0 for a straight path, 0 for a closed or degenerate one.
    double CalculateStraightness(const Polyline& polyline);

    std::vector<CandidateSegment> ExtractLineSegments(const std::vector<Polyline>& polylines, double minWallLength = 20.0,
                                                      double minStraightness = 0.8);

    size_t CountClosedLoops(const std::vector<Polyline>& polylines, double closureTolerance = 5.0);

    // Checks that traced input is worth cleaning. Never modifies the geometry.
    ValidationResult ValidateInput(const std::vector<Polyline>& polylines, const ValidationOptions& options = {});

    // Prints a summary of the polylines and their aggregate statistics to stdout.
    void LogInputGeometry(const std::vector<Polyline>& polylines, std::optional<double> pxToMeters = std::nullopt);

} // namespace Orthoplan::Engine

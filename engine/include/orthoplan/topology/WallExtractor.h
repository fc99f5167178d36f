#pragma once

#include <limits>
#include <vector>
#include "orthoplan/architecture.h"
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct WallDetectionOptions {
        double minLength = 10.0;
        double maxLength = std::numeric_limits<double>::infinity();
        double defaultThickness = 2.0; // used when a segment carries none
    };

    struct WallExtractionOptions {
        double minWallLength = 10.0;
        double wallThickness = 2.0;
        double openingThreshold = 10.0; // largest gap reported as an opening
    };

    struct WallClassificationOptions {
        double exteriorThickness = 6.0;
        double interiorThickness = 2.0;
    };

    struct WallGeometry {
        std::vector<Wall> walls;
        std::vector<Opening> openings;
    };

    constexpr double OPENING_ANGLE_TOLERANCE = 0.1; // radians

    // Segments whose length lies in [minLength, maxLength]. Walls come out unclassified.
    std::vector<Wall> DetectWalls(const std::vector<Segment>& geometry, const WallDetectionOptions& options = {});

    // Gaps between consecutive aligned walls. A gap narrower than half the threshold is a
    // door, anything else up to the threshold a window.
    std::vector<Opening> FindOpenings(const std::vector<Wall>& walls, double openingThreshold = 10.0);

    WallGeometry ExtractWallGeometry(const std::vector<Segment>& geometry, const WallExtractionOptions& options = {});

    // thickness >= (exterior + interior) / 2 -> EXTERIOR
    std::vector<Wall> ClassifyWalls(const std::vector<Wall>& walls, const WallClassificationOptions& options = {});

    std::vector<Wall> ExtractWallsFromPolylines(const std::vector<Polyline>& polylines, double minWallLength = 10.0,
                                                double wallThickness = 2.0);

} // namespace Orthoplan::Engine

#pragma once

#include <array>
#include <optional>
#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct SnapOptions {
        double toleranceDeg = 5.0;
        bool use45Deg = false;   // second pass towards 45/135/225/315 degrees
        bool snapToGrid = false; // round endpoints to the grid before angle snapping
        double gridSize = 10.0;
    };

    // Angle indices grouped by the orthogonal direction they snap to.
    // Slot 0..3 hold 0, 90, 180 and 270 degrees.
    struct AngleBucket {
        size_t index;
        double angle;
        double snapped;
    };
    using AngleBuckets = std::array<std::vector<AngleBucket>, 4>;

    // Rounds a segment angle to the nearest 90 degree multiple, keeping the start
    // point fixed and the original length.
    class OrthoSnapper {
    public:
        explicit OrthoSnapper(const SnapOptions& options = {});

        std::vector<Segment> Snap(const std::vector<Segment>& lines) const;

        // Nearest 90 degree multiple of an angle, in [0, 2*pi).
        static double SnapAngleToOrthogonal(double angle);
        // Snapped angle, or nothing if the angle is further than tolerance from it.
        static std::optional<double> SnapAngleWithTolerance(double angle, double toleranceRad);
        static std::optional<Segment> SnapLineToOrthogonal(const Segment& line, double toleranceRad);
        static std::optional<Segment> SnapLineTo45(const Segment& line, double toleranceRad);

        static AngleBuckets BucketAngles(const std::vector<double>& angles, double toleranceRad = 0.1);
        // Most populated orthogonal direction among the lines (first bucket wins ties).
        static std::optional<double> GetDominantOrthogonalDirection(const std::vector<Segment>& lines, double toleranceRad = 0.1);

    private:
        SnapOptions options_;
    };

    // Orthogonal pass followed by the optional 45 degree pass.
    std::vector<Segment> SnapLines(const std::vector<Segment>& lines, const SnapOptions& options = {});

    // Grid pre-snap (gridSize, 0 disables) followed by the orthogonal pass.
    std::vector<Segment> SnapToOrthogonal(const std::vector<Segment>& lines, double toleranceRad = 0.1, double gridSize = 10.0);

} // namespace Orthoplan::Engine

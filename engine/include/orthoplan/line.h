#pragma once

#include <optional>
#include <vector>
#include <glm/vec2.hpp>

namespace Orthoplan::Engine {

    // Plan coordinates are kept in double precision so repeated runs stay bit-identical
    // with the tracer's output units (pixels or millimeters).
    using Point2D = glm::dvec2;

    // Ordered list of points. A polyline is closed when its first and last points
    // coincide within the caller's tolerance.
    using Polyline = std::vector<Point2D>;

    // Represents a single straight edge of the traced drawing.
    struct Segment {
        Point2D start{0.0};
        Point2D end{0.0};
        std::optional<double> thickness; // Only set when the tracer measured a stroke width

        Segment() = default;
        Segment(const Point2D& s, const Point2D& e) : start(s), end(e) {}
        Segment(const Point2D& s, const Point2D& e, std::optional<double> t) : start(s), end(e), thickness(t) {}

        bool operator==(const Segment& other) const {
            return start == other.start && end == other.end && thickness == other.thickness;
        }
        bool operator!=(const Segment& other) const { return !(*this == other); }
    };

} // namespace Orthoplan::Engine

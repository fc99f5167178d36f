#pragma once

#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    enum class WallType {
        EXTERIOR,
        INTERIOR
    };

    enum class OpeningType {
        DOOR,
        WINDOW
    };

    struct Wall {
        Point2D start{0.0};
        Point2D end{0.0};
        double thickness = 0.0;
        WallType type = WallType::INTERIOR;

        bool operator==(const Wall& other) const {
            return start == other.start && end == other.end && thickness == other.thickness && type == other.type;
        }
    };

    // Gap between two aligned walls.
    struct Opening {
        Point2D start{0.0};
        Point2D end{0.0};
        Point2D position{0.0}; // midpoint of the gap
        double width = 0.0;
        OpeningType type = OpeningType::WINDOW;

        bool operator==(const Opening& other) const {
            return start == other.start && end == other.end && width == other.width && type == other.type;
        }
    };

    // Closed polygon, first point repeated as the last one.
    struct Room {
        std::vector<Point2D> points;
        double area = 0.0; // absolute shoelace area

        bool operator==(const Room& other) const {
            return points == other.points && area == other.area;
        }
    };

    const char* ToString(WallType type);
    const char* ToString(OpeningType type);

} // namespace Orthoplan::Engine

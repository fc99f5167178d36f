#include <orthoplan/geometry/Geometry2D.h>

#include <catch2/catch.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <limits>

using namespace Orthoplan::Engine;
using namespace Orthoplan::Engine::Geometry;

// ============================================================================
// Angles
// ============================================================================

TEST_CASE("Geometry2D: LineAngle is normalized to [0, 2pi)", "[geometry][angle]") {
    REQUIRE(LineAngle(Point2D(0, 0), Point2D(10, 0)) == Approx(0.0));
    REQUIRE(LineAngle(Point2D(0, 0), Point2D(0, 10)) == Approx(glm::half_pi<double>()));
    REQUIRE(LineAngle(Point2D(0, 0), Point2D(-10, 0)) == Approx(glm::pi<double>()));
    REQUIRE(LineAngle(Point2D(0, 0), Point2D(0, -10)) == Approx(3.0 * glm::half_pi<double>()));
}

TEST_CASE("Geometry2D: NormalizeAngle wraps into one turn", "[geometry][angle]") {
    REQUIRE(NormalizeAngle(-glm::half_pi<double>()) == Approx(3.0 * glm::half_pi<double>()));
    REQUIRE(NormalizeAngle(5.0 * glm::pi<double>()) == Approx(glm::pi<double>()));
    REQUIRE(NormalizeAngle(0.25) == Approx(0.25));
}

TEST_CASE("Geometry2D: NormalizeAngleDiff maps multiples of pi to pi", "[geometry][angle]") {
    REQUIRE(NormalizeAngleDiff(glm::pi<double>()) == Approx(glm::pi<double>()));
    REQUIRE(NormalizeAngleDiff(0.0) == Approx(0.0));
    REQUIRE(NormalizeAngleDiff(-0.1) == Approx(glm::pi<double>() - 0.1));
}

TEST_CASE("Geometry2D: AreAnglesParallel treats opposite directions as parallel", "[geometry][angle]") {
    const double pi = glm::pi<double>();

    REQUIRE(AreAnglesParallel(0.0, pi, 0.01));
    REQUIRE(AreAnglesParallel(0.0, 0.005, 0.01));
    REQUIRE(AreAnglesParallel(glm::half_pi<double>(), 3.0 * glm::half_pi<double>(), 0.01));
    REQUIRE_FALSE(AreAnglesParallel(0.0, glm::half_pi<double>(), 0.01));
    REQUIRE_FALSE(AreAnglesParallel(0.0, 0.05, 0.01));

    Segment a(Point2D(0, 0), Point2D(10, 0));
    Segment b(Point2D(10, 5), Point2D(0, 5));
    REQUIRE(IsParallel(a, b));
}

// ============================================================================
// Projection and distance
// ============================================================================

TEST_CASE("Geometry2D: ProjectPointOnSegment clamps to the segment", "[geometry][projection]") {
    Point2D start(0, 0);
    Point2D end(10, 0);

    Point2D inside = ProjectPointOnSegment(Point2D(4, 3), start, end);
    REQUIRE(inside.x == Approx(4.0));
    REQUIRE(inside.y == Approx(0.0));

    Point2D clamped = ProjectPointOnSegment(Point2D(15, 3), start, end);
    REQUIRE(clamped.x == Approx(10.0));

    Point2D degenerate = ProjectPointOnSegment(Point2D(4, 3), start, start);
    REQUIRE(degenerate == start);

    Point2D onLine = ProjectPointOnLine(Point2D(15, 3), start, end);
    REQUIRE(onLine.x == Approx(15.0));
}

TEST_CASE("Geometry2D: perpendicular distance uses the infinite line", "[geometry][projection]") {
    REQUIRE(PerpendicularDistance(Point2D(50, 4), Point2D(0, 0), Point2D(10, 0)) == Approx(4.0));
    REQUIRE(SignedPerpendicularDistance(Point2D(5, 4), Point2D(0, 0), Point2D(10, 0)) == Approx(4.0));
    REQUIRE(SignedPerpendicularDistance(Point2D(5, -4), Point2D(0, 0), Point2D(10, 0)) == Approx(-4.0));
}

TEST_CASE("Geometry2D: segment and line intersection", "[geometry][intersection]") {
    auto hit = IntersectSegments(Point2D(0, 0), Point2D(10, 10), Point2D(0, 10), Point2D(10, 0));
    REQUIRE(hit.has_value());
    REQUIRE(hit->x == Approx(5.0));
    REQUIRE(hit->y == Approx(5.0));

    SECTION("Parallel segments do not intersect") {
        REQUIRE_FALSE(IntersectSegments(Point2D(0, 0), Point2D(10, 0), Point2D(0, 5), Point2D(10, 5)).has_value());
    }

    SECTION("Lines intersect beyond the segments") {
        REQUIRE_FALSE(IntersectSegments(Point2D(0, 0), Point2D(1, 0), Point2D(5, -1), Point2D(5, 1)).has_value());
        auto lineHit = IntersectLines(Point2D(0, 0), Point2D(1, 0), Point2D(5, -1), Point2D(5, 1));
        REQUIRE(lineHit.has_value());
        REQUIRE(lineHit->x == Approx(5.0));
        REQUIRE(lineHit->y == Approx(0.0).margin(1e-12));
    }
}

// ============================================================================
// Polygons and polylines
// ============================================================================

TEST_CASE("Geometry2D: shoelace area", "[geometry][area]") {
    std::vector<Point2D> ccw = { {0, 0}, {10, 0}, {10, 10}, {0, 10} };
    REQUIRE(SignedArea(ccw) == Approx(100.0));

    std::vector<Point2D> cw(ccw.rbegin(), ccw.rend());
    REQUIRE(SignedArea(cw) == Approx(-100.0));
    REQUIRE(PolygonArea(cw) == Approx(100.0));

    SECTION("Repeating the first point does not change the area") {
        std::vector<Point2D> closed = ccw;
        closed.push_back(closed.front());
        REQUIRE(PolygonArea(closed) == Approx(100.0));
    }

    SECTION("Fewer than three points has no area") {
        REQUIRE(PolygonArea({ {0, 0}, {10, 0} }) == 0.0);
    }
}

TEST_CASE("Geometry2D: SimplifyPolyline drops points within tolerance", "[geometry][polyline]") {
    std::vector<Point2D> nearlyStraight = { {0, 0}, {5, 0.1}, {10, 0} };
    REQUIRE(SimplifyPolyline(nearlyStraight, 1.0).size() == 2);

    std::vector<Point2D> corner = { {0, 0}, {5, 0.1}, {10, 0}, {10, 10} };
    std::vector<Point2D> simplified = SimplifyPolyline(corner, 1.0);
    REQUIRE(simplified.size() == 3);
    REQUIRE(simplified[1] == Point2D(10, 0));
}

// ============================================================================
// Validity and grid snapping
// ============================================================================

TEST_CASE("Geometry2D: segment validity", "[geometry][validation]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE(IsValidSegment(Segment(Point2D(0, 0), Point2D(10, 0))));
    REQUIRE(IsValidSegment(Segment(Point2D(0, 0), Point2D(0.002, 0))));
    REQUIRE_FALSE(IsValidSegment(Segment(Point2D(0, 0), Point2D(0.0005, 0))));
    REQUIRE_FALSE(IsValidSegment(Segment(Point2D(3, 3), Point2D(3, 3))));
    REQUIRE_FALSE(IsValidSegment(Segment(Point2D(nan, 0), Point2D(10, 0))));
    REQUIRE_FALSE(IsValidSegment(Segment(Point2D(0, 0), Point2D(inf, 0))));
}

TEST_CASE("Geometry2D: grid snapping rounds half up", "[geometry][grid]") {
    REQUIRE(RoundHalfUp(2.5) == 3.0);
    REQUIRE(RoundHalfUp(-2.5) == -2.0);

    Point2D snapped = SnapPointToGrid(Point2D(14.9, -6.0), 10.0);
    REQUIRE(snapped.x == 10.0);
    REQUIRE(snapped.y == -10.0);

    REQUIRE(SnapPointToGrid(Point2D(1.5, 2.5), 0.0) == Point2D(1.5, 2.5));
}

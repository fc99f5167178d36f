#include <orthoplan/topology/OrthoSnapper.h>
#include <orthoplan/geometry/Geometry2D.h>

#include <catch2/catch.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include <limits>

using namespace Orthoplan::Engine;

// ============================================================================
// Segment snapping
// ============================================================================

TEST_CASE("OrthoSnapper: near-horizontal traces become exactly horizontal", "[snapper]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0.1)),
        Segment(Point2D(0, 5), Point2D(10, 5.05)),
    };

    std::vector<Segment> snapped = SnapLines(lines);
    REQUIRE(snapped.size() == 2);

    for (size_t i = 0; i < snapped.size(); ++i) {
        REQUIRE(snapped[i].start == lines[i].start);
        REQUIRE(snapped[i].end.y == snapped[i].start.y);
        REQUIRE(Geometry::LineAngle(snapped[i]) == 0.0);
        REQUIRE(Geometry::LineLength(snapped[i]) == Approx(Geometry::LineLength(lines[i])));
    }
}

TEST_CASE("OrthoSnapper: every orthogonal direction is reachable", "[snapper]") {
    const double tolerance = 5.0 * glm::pi<double>() / 180.0;

    auto vertical = OrthoSnapper::SnapLineToOrthogonal(Segment(Point2D(3, 3), Point2D(3.2, 13)), tolerance);
    REQUIRE(vertical.has_value());
    REQUIRE(vertical->start == Point2D(3, 3));
    REQUIRE(vertical->end.x == 3.0);
    REQUIRE(vertical->end.y > 12.9);

    auto left = OrthoSnapper::SnapLineToOrthogonal(Segment(Point2D(0, 0), Point2D(-20, 0.5)), tolerance);
    REQUIRE(left.has_value());
    REQUIRE(left->end.y == 0.0);
    REQUIRE(left->end.x < -19.9);

    auto down = OrthoSnapper::SnapLineToOrthogonal(Segment(Point2D(0, 0), Point2D(-0.5, -20)), tolerance);
    REQUIRE(down.has_value());
    REQUIRE(down->end.x == 0.0);
    REQUIRE(down->end.y < -19.9);
}

TEST_CASE("OrthoSnapper: traces outside the tolerance are left alone", "[snapper]") {
    Segment steep(Point2D(0, 0), Point2D(10, 3));
    std::vector<Segment> snapped = SnapLines({ steep });
    REQUIRE(snapped.size() == 1);
    REQUIRE(snapped[0] == steep);
}

TEST_CASE("OrthoSnapper: the 45 degree pass is optional", "[snapper][diagonal]") {
    Segment diagonal(Point2D(0, 0), Point2D(10, 10.2));

    SnapOptions options;
    REQUIRE(SnapLines({ diagonal }, options)[0] == diagonal);

    options.use45Deg = true;
    Segment snapped = SnapLines({ diagonal }, options)[0];
    REQUIRE(snapped.start == diagonal.start);
    REQUIRE(snapped.end.x == Approx(snapped.end.y));
    REQUIRE(Geometry::LineLength(snapped) == Approx(Geometry::LineLength(diagonal)));
}

TEST_CASE("OrthoSnapper: grid pre-snap moves both endpoints", "[snapper][grid]") {
    SnapOptions options;
    options.snapToGrid = true;
    options.gridSize = 10.0;

    Segment snapped = SnapLines({ Segment(Point2D(1, 2), Point2D(49, 3)) }, options)[0];
    REQUIRE(snapped.start == Point2D(0, 0));
    REQUIRE(snapped.end == Point2D(50, 0));
}

TEST_CASE("OrthoSnapper: malformed segments pass through", "[snapper][edge]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Segment> lines = {
        Segment(Point2D(5, 5), Point2D(5, 5)),
        Segment(Point2D(nan, 0), Point2D(10, 0)),
    };

    std::vector<Segment> snapped = SnapLines(lines);
    REQUIRE(snapped.size() == 2);
    REQUIRE(snapped[0] == lines[0]);
    REQUIRE(std::isnan(snapped[1].start.x));
    REQUIRE(snapped[1].end == Point2D(10, 0));

    REQUIRE(SnapLines({}).empty());
}

TEST_CASE("OrthoSnapper: thickness survives snapping", "[snapper]") {
    Segment wall(Point2D(0, 0), Point2D(100, 1), 6.0);
    Segment snapped = SnapLines({ wall })[0];
    REQUIRE(snapped.thickness.has_value());
    REQUIRE(*snapped.thickness == 6.0);
}

// ============================================================================
// Angle helpers
// ============================================================================

TEST_CASE("OrthoSnapper: angle helpers", "[snapper][angle]") {
    const double halfPi = glm::half_pi<double>();

    REQUIRE(OrthoSnapper::SnapAngleToOrthogonal(0.1) == 0.0);
    REQUIRE(OrthoSnapper::SnapAngleToOrthogonal(halfPi + 0.05) == Approx(halfPi));
    REQUIRE(OrthoSnapper::SnapAngleToOrthogonal(glm::two_pi<double>() - 0.01) == 0.0);

    REQUIRE(OrthoSnapper::SnapAngleWithTolerance(0.05, 0.1).has_value());
    REQUIRE_FALSE(OrthoSnapper::SnapAngleWithTolerance(0.3, 0.1).has_value());
}

TEST_CASE("OrthoSnapper: angle buckets and dominant direction", "[snapper][angle]") {
    AngleBuckets buckets = OrthoSnapper::BucketAngles({ 0.0, glm::half_pi<double>(), 0.3, 0.02 }, 0.1);
    REQUIRE(buckets[0].size() == 2);
    REQUIRE(buckets[0][0].index == 0);
    REQUIRE(buckets[0][1].index == 3);
    REQUIRE(buckets[1].size() == 1);
    REQUIRE(buckets[2].empty());
    REQUIRE(buckets[3].empty());

    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(0, 10)),
        Segment(Point2D(0, 0), Point2D(0, 20)),
        Segment(Point2D(0, 0), Point2D(10, 0)),
    };
    auto dominant = OrthoSnapper::GetDominantOrthogonalDirection(lines);
    REQUIRE(dominant.has_value());
    REQUIRE(*dominant == Approx(glm::half_pi<double>()));

    REQUIRE_FALSE(OrthoSnapper::GetDominantOrthogonalDirection({}).has_value());
}

#include <orthoplan/topology/ColinearMerger.h>

#include <catch2/catch.hpp>

using namespace Orthoplan::Engine;

TEST_CASE("ColinearMerger: pieces within the merge distance are fused", "[colinear]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(15, 0), Point2D(30, 0)),
    };

    std::vector<Segment> merged = MergeColinearSegments(lines);
    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].start == Point2D(0, 0));
    REQUIRE(merged[0].end == Point2D(30, 0));
}

TEST_CASE("ColinearMerger: reversed pieces are oriented before the sweep", "[colinear]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(30, 0), Point2D(15, 0)),
    };

    std::vector<Segment> merged = MergeColinearSegments(lines);
    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].start == Point2D(0, 0));
    REQUIRE(merged[0].end == Point2D(30, 0));
}

TEST_CASE("ColinearMerger: a wide gap splits the run", "[colinear]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(25, 0), Point2D(40, 0)),
    };
    REQUIRE(MergeColinearSegments(lines).size() == 2);
}

TEST_CASE("ColinearMerger: opposite edges of a room stay apart", "[colinear]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(100, 0)),
        Segment(Point2D(100, 20), Point2D(0, 20)),
    };
    REQUIRE(MergeColinearSegments(lines).size() == 2);
}

TEST_CASE("ColinearMerger: a contained piece is absorbed", "[colinear]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(20, 0)),
        Segment(Point2D(10, 0), Point2D(15, 0)),
    };

    std::vector<Segment> merged = MergeColinearSegments(lines);
    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].start == Point2D(0, 0));
    REQUIRE(merged[0].end == Point2D(20, 0));
}

TEST_CASE("ColinearMerger: sorting follows the first member's direction", "[colinear][sort]") {
    std::vector<Segment> group = {
        Segment(Point2D(50, 0), Point2D(40, 0)),
        Segment(Point2D(0, 0), Point2D(10, 0)),
    };

    std::vector<Segment> sorted = ColinearMerger::SortAlongDirection(group);
    REQUIRE(sorted.size() == 2);
    // Reference direction is -x, so the piece at x=40..50 comes first.
    REQUIRE(sorted[0] == group[0]);
    REQUIRE(sorted[1].start == Point2D(10, 0));
    REQUIRE(sorted[1].end == Point2D(0, 0));
}

TEST_CASE("ColinearMerger: gap measurement", "[colinear][gap]") {
    Segment running(Point2D(0, 0), Point2D(10, 0));
    REQUIRE(ColinearMerger::GapBetween(running, Segment(Point2D(13, 4), Point2D(20, 4))) == Approx(5.0));
    REQUIRE(ColinearMerger::GapBetween(running, Segment(Point2D(5, 2), Point2D(20, 2))) == Approx(2.0));
}

#include <orthoplan/topology/GapBridger.h>

#include <catch2/catch.hpp>

using namespace Orthoplan::Engine;

TEST_CASE("GapBridger: a small gap between aligned segments is closed", "[bridge]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(5, 0)),
        Segment(Point2D(5.2, 0), Point2D(10, 0)),
    };

    std::vector<Segment> bridged = BridgeGaps(lines);
    REQUIRE(bridged.size() == 1);
    REQUIRE(bridged[0].start == Point2D(0, 0));
    REQUIRE(bridged[0].end == Point2D(10, 0));
}

TEST_CASE("GapBridger: gaps wider than maxGap are kept", "[bridge]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(16, 0), Point2D(30, 0)),
    };
    REQUIRE(BridgeGaps(lines) == lines);

    GapBridgeOptions wide;
    wide.maxGap = 7.0;
    REQUIRE(BridgeGaps(lines, wide).size() == 1);
}

TEST_CASE("GapBridger: perpendicular neighbours are not bridged", "[bridge]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(11, 1), Point2D(11, 20)),
    };
    REQUIRE(BridgeGaps(lines) == lines);
}

TEST_CASE("GapBridger: touching endpoints are already connected", "[bridge]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(10, 0), Point2D(20, 0)),
    };
    REQUIRE(BridgeGaps(lines) == lines);
}

TEST_CASE("GapBridger: each segment takes part in one bridge per call", "[bridge]") {
    std::vector<Segment> lines = {
        Segment(Point2D(0, 0), Point2D(10, 0)),
        Segment(Point2D(12, 0), Point2D(20, 0)),
        Segment(Point2D(22, 0), Point2D(30, 0)),
    };

    std::vector<Segment> bridged = BridgeGaps(lines);
    REQUIRE(bridged.size() == 2);
    REQUIRE(bridged[0] == Segment(Point2D(0, 0), Point2D(20, 0)));
    REQUIRE(bridged[1] == lines[2]);

    // A second pass picks up the remaining gap.
    std::vector<Segment> again = BridgeGaps(bridged);
    REQUIRE(again.size() == 1);
    REQUIRE(again[0] == Segment(Point2D(0, 0), Point2D(30, 0)));
}

TEST_CASE("GapBridger: ConnectLines spans the unconnected endpoints", "[bridge][connect]") {
    Segment a(Point2D(0, 0), Point2D(10, 0), 3.0);
    Segment b(Point2D(12, 0), Point2D(20, 0));

    Segment endToStart = GapBridger::ConnectLines(a, b, false, true);
    REQUIRE(endToStart.start == Point2D(0, 0));
    REQUIRE(endToStart.end == Point2D(20, 0));
    REQUIRE(endToStart.thickness == a.thickness);

    Segment reversed(Point2D(20, 0), Point2D(12, 0));
    Segment endToEnd = GapBridger::ConnectLines(a, reversed, false, false);
    REQUIRE(endToEnd.start == Point2D(0, 0));
    REQUIRE(endToEnd.end == Point2D(20, 0));

    Segment before(Point2D(-10, 0), Point2D(-2, 0));
    Segment startToEnd = GapBridger::ConnectLines(a, before, true, false);
    REQUIRE(startToEnd.start == Point2D(-10, 0));
    REQUIRE(startToEnd.end == Point2D(10, 0));

    Segment beforeReversed(Point2D(-2, 0), Point2D(-10, 0));
    Segment startToStart = GapBridger::ConnectLines(a, beforeReversed, true, true);
    REQUIRE(startToStart.start == Point2D(-10, 0));
    REQUIRE(startToStart.end == Point2D(10, 0));
}

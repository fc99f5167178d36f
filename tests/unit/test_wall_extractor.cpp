#include <orthoplan/topology/WallExtractor.h>

#include <catch2/catch.hpp>
#include <string>

using namespace Orthoplan::Engine;

namespace {
    Wall MakeWall(Point2D start, Point2D end, double thickness = 2.0) {
        Wall wall;
        wall.start = start;
        wall.end = end;
        wall.thickness = thickness;
        return wall;
    }
}

// ============================================================================
// Wall detection
// ============================================================================

TEST_CASE("WallExtractor: short segments are not walls", "[walls]") {
    std::vector<Segment> geometry = {
        Segment(Point2D(0, 0), Point2D(100, 0)),
        Segment(Point2D(0, 0), Point2D(5, 0)),
        Segment(Point2D(0, 0), Point2D(0, 10)),
    };

    std::vector<Wall> walls = DetectWalls(geometry);
    REQUIRE(walls.size() == 2);
    REQUIRE(walls[0].end == Point2D(100, 0));
    REQUIRE(walls[1].end == Point2D(0, 10));

    WallDetectionOptions capped;
    capped.maxLength = 50.0;
    REQUIRE(DetectWalls(geometry, capped).size() == 1);
}

TEST_CASE("WallExtractor: explicit thickness wins over the default", "[walls]") {
    std::vector<Segment> geometry = {
        Segment(Point2D(0, 0), Point2D(100, 0), 6.0),
        Segment(Point2D(0, 0), Point2D(0, 100)),
    };

    std::vector<Wall> walls = DetectWalls(geometry);
    REQUIRE(walls[0].thickness == 6.0);
    REQUIRE(walls[1].thickness == 2.0);
}

TEST_CASE("WallExtractor: classification by thickness", "[walls][classify]") {
    std::vector<Wall> walls = {
        MakeWall(Point2D(0, 0), Point2D(100, 0), 6.0),
        MakeWall(Point2D(0, 0), Point2D(0, 100), 4.0),
        MakeWall(Point2D(0, 50), Point2D(100, 50), 3.9),
    };

    std::vector<Wall> classified = ClassifyWalls(walls);
    REQUIRE(classified[0].type == WallType::EXTERIOR);
    REQUIRE(classified[1].type == WallType::EXTERIOR);
    REQUIRE(classified[2].type == WallType::INTERIOR);
    REQUIRE(classified[2].start == walls[2].start);

    WallClassificationOptions thick;
    thick.exteriorThickness = 12.0;
    REQUIRE(ClassifyWalls(walls, thick)[0].type == WallType::INTERIOR);

    REQUIRE(std::string(ToString(WallType::EXTERIOR)) == "exterior");
}

// ============================================================================
// Openings
// ============================================================================

TEST_CASE("WallExtractor: a narrow gap between aligned walls is a door", "[walls][openings]") {
    std::vector<Wall> walls = {
        MakeWall(Point2D(0, 0), Point2D(20, 0)),
        MakeWall(Point2D(20.9, 0), Point2D(40, 0)),
    };

    std::vector<Opening> openings = FindOpenings(walls, 10.0);
    REQUIRE(openings.size() == 1);
    REQUIRE(openings[0].type == OpeningType::DOOR);
    REQUIRE(openings[0].width == Approx(0.9));
    REQUIRE(openings[0].start == Point2D(20, 0));
    REQUIRE(openings[0].end == Point2D(20.9, 0));
    REQUIRE(openings[0].position.x == Approx(20.45));
    REQUIRE(std::string(ToString(openings[0].type)) == "door");
}

TEST_CASE("WallExtractor: a wider gap is a window", "[walls][openings]") {
    std::vector<Wall> walls = {
        MakeWall(Point2D(47, 0), Point2D(100, 0)),
        MakeWall(Point2D(40, 0), Point2D(0, 0)),
    };

    std::vector<Opening> openings = FindOpenings(walls);
    REQUIRE(openings.size() == 1);
    REQUIRE(openings[0].type == OpeningType::WINDOW);
    REQUIRE(openings[0].width == Approx(7.0));
}

TEST_CASE("WallExtractor: gaps beyond the threshold or across directions are ignored", "[walls][openings]") {
    std::vector<Wall> farApart = {
        MakeWall(Point2D(0, 0), Point2D(20, 0)),
        MakeWall(Point2D(32, 0), Point2D(50, 0)),
    };
    REQUIRE(FindOpenings(farApart, 10.0).empty());

    std::vector<Wall> corner = {
        MakeWall(Point2D(0, 0), Point2D(20, 0)),
        MakeWall(Point2D(22, 2), Point2D(22, 30)),
    };
    REQUIRE(FindOpenings(corner, 10.0).empty());

    std::vector<Wall> touching = {
        MakeWall(Point2D(0, 0), Point2D(20, 0)),
        MakeWall(Point2D(20, 0), Point2D(40, 0)),
    };
    REQUIRE(FindOpenings(touching, 10.0).empty());
}

TEST_CASE("WallExtractor: ExtractWallGeometry chains detection and openings", "[walls]") {
    std::vector<Segment> geometry = {
        Segment(Point2D(0, 0), Point2D(20, 0)),
        Segment(Point2D(23, 0), Point2D(60, 0)),
        Segment(Point2D(70, 0), Point2D(72, 0)),
    };

    WallGeometry result = ExtractWallGeometry(geometry);
    REQUIRE(result.walls.size() == 2);
    REQUIRE(result.openings.size() == 1);
    REQUIRE(result.openings[0].type == OpeningType::DOOR);

    REQUIRE(ExtractWallGeometry({}).walls.empty());
}

TEST_CASE("WallExtractor: polylines are split into walls", "[walls][polylines]") {
    std::vector<Polyline> polylines = {
        { {0, 0}, {100, 0}, {100, 100}, {100, 100}, {100, 104} },
        { {7, 7} },
    };

    std::vector<Wall> walls = ExtractWallsFromPolylines(polylines, 10.0, 3.0);
    REQUIRE(walls.size() == 2);
    REQUIRE(walls[0].thickness == 3.0);
    REQUIRE(walls[1].start == Point2D(100, 0));
    REQUIRE(walls[1].end == Point2D(100, 100));
}

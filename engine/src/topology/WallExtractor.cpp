#include "orthoplan/topology/WallExtractor.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <glm/geometric.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <utility>

namespace Orthoplan::Engine {

namespace {

    bool IsWallCandidate(const Segment& line, const WallDetectionOptions& options) {
        if (!Geometry::IsFinite(line.start) || !Geometry::IsFinite(line.end)) return false;
        double length = Geometry::LineLength(line);
        return length >= options.minLength && length <= options.maxLength;
    }

    double WallAngle(const Wall& wall) {
        return Geometry::LineAngle(wall.start, wall.end);
    }

    // First-seen greedy grouping by undirected direction.
    std::vector<std::vector<Wall>> GroupWallsByOrientation(const std::vector<Wall>& walls, double angleTolerance) {
        std::vector<std::vector<Wall>> groups;
        std::vector<bool> used(walls.size(), false);

        for (size_t i = 0; i < walls.size(); ++i) {
            if (used[i]) continue;
            used[i] = true;
            std::vector<Wall> group{ walls[i] };
            const double angle1 = WallAngle(walls[i]);

            for (size_t j = i + 1; j < walls.size(); ++j) {
                if (used[j]) continue;
                if (Geometry::AreAnglesParallel(angle1, WallAngle(walls[j]), angleTolerance)) {
                    group.push_back(walls[j]);
                    used[j] = true;
                }
            }
            groups.push_back(std::move(group));
        }
        return groups;
    }

    std::vector<Wall> SortWallsAlongDirection(const std::vector<Wall>& walls) {
        if (walls.empty()) return {};

        const double refAngle = WallAngle(walls.front());
        const Point2D axis(std::cos(refAngle), std::sin(refAngle));

        std::vector<std::pair<double, Wall>> projected;
        projected.reserve(walls.size());
        for (const Wall& wall : walls) {
            projected.emplace_back(glm::dot(Geometry::Midpoint(wall.start, wall.end), axis), wall);
        }
        std::stable_sort(projected.begin(), projected.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<Wall> sorted;
        sorted.reserve(projected.size());
        for (auto& item : projected) sorted.push_back(std::move(item.second));
        return sorted;
    }

    struct WallGap {
        Point2D start{0.0};
        Point2D end{0.0};
        double size = 0.0;
    };

    // Closest endpoint pair across two aligned walls. Touching or misaligned walls have no gap.
    std::optional<WallGap> GapBetweenWalls(const Wall& wall1, const Wall& wall2) {
        const std::array<WallGap, 4> candidates = {{
            { wall1.end, wall2.start, Geometry::Distance(wall1.end, wall2.start) },
            { wall1.end, wall2.end, Geometry::Distance(wall1.end, wall2.end) },
            { wall1.start, wall2.start, Geometry::Distance(wall1.start, wall2.start) },
            { wall1.start, wall2.end, Geometry::Distance(wall1.start, wall2.end) },
        }};

        const WallGap* closest = &candidates[0];
        for (const WallGap& candidate : candidates) {
            if (candidate.size < closest->size) closest = &candidate;
        }

        bool aligned = Geometry::AreAnglesParallel(WallAngle(wall1), WallAngle(wall2), OPENING_ANGLE_TOLERANCE);
        if (!aligned || !(closest->size > 0.0)) return std::nullopt;
        return *closest;
    }

} // anonymous namespace

std::vector<Wall> DetectWalls(const std::vector<Segment>& geometry, const WallDetectionOptions& options) {
    std::vector<Wall> walls;
    for (const Segment& line : geometry) {
        if (!IsWallCandidate(line, options)) continue;
        Wall wall;
        wall.start = line.start;
        wall.end = line.end;
        wall.thickness = line.thickness.value_or(options.defaultThickness);
        walls.push_back(wall);
    }
    return walls;
}

std::vector<Opening> FindOpenings(const std::vector<Wall>& walls, double openingThreshold) {
    std::vector<Opening> openings;
    if (walls.size() < 2) return openings;

    for (const std::vector<Wall>& group : GroupWallsByOrientation(walls, OPENING_ANGLE_TOLERANCE)) {
        if (group.size() < 2) continue;

        const std::vector<Wall> sorted = SortWallsAlongDirection(group);
        for (size_t i = 0; i + 1 < sorted.size(); ++i) {
            std::optional<WallGap> gap = GapBetweenWalls(sorted[i], sorted[i + 1]);
            if (!gap || gap->size > openingThreshold) continue;

            Opening opening;
            opening.start = gap->start;
            opening.end = gap->end;
            opening.position = Geometry::Midpoint(gap->start, gap->end);
            opening.width = gap->size;
            opening.type = gap->size < openingThreshold / 2.0 ? OpeningType::DOOR : OpeningType::WINDOW;
            openings.push_back(opening);
        }
    }
    return openings;
}

WallGeometry ExtractWallGeometry(const std::vector<Segment>& geometry, const WallExtractionOptions& options) {
    WallGeometry result;
    if (geometry.empty()) return result;

    WallDetectionOptions detection;
    detection.minLength = options.minWallLength;
    detection.defaultThickness = options.wallThickness;

    result.walls = DetectWalls(geometry, detection);
    result.openings = FindOpenings(result.walls, options.openingThreshold);
    return result;
}

std::vector<Wall> ClassifyWalls(const std::vector<Wall>& walls, const WallClassificationOptions& options) {
    const double threshold = (options.exteriorThickness + options.interiorThickness) / 2.0;

    std::vector<Wall> classified = walls;
    for (Wall& wall : classified) {
        wall.type = wall.thickness >= threshold ? WallType::EXTERIOR : WallType::INTERIOR;
    }
    return classified;
}

std::vector<Wall> ExtractWallsFromPolylines(const std::vector<Polyline>& polylines, double minWallLength, double wallThickness) {
    std::vector<Segment> geometry;
    for (const Polyline& polyline : polylines) {
        if (polyline.size() < 2) continue;
        for (size_t i = 0; i + 1 < polyline.size(); ++i) {
            Segment segment(polyline[i], polyline[i + 1], wallThickness);
            if (Geometry::IsValidSegment(segment)) {
                geometry.push_back(segment);
            }
        }
    }

    WallDetectionOptions detection;
    detection.minLength = minWallLength;
    detection.defaultThickness = wallThickness;
    return DetectWalls(geometry, detection);
}

} // namespace Orthoplan::Engine

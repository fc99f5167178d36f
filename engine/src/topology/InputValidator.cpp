#include "orthoplan/topology/InputValidator.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <iterator>

namespace Orthoplan::Engine {

namespace {

    const double CLOSING_SEGMENT_TOLERANCE = 5.0;
    const size_t LOGGED_POLYLINES = 5;
    const size_t LOGGED_POINTS = 3;

    double PathLength(const Polyline& polyline) {
        double length = 0.0;
        for (size_t i = 1; i < polyline.size(); ++i) {
            length += Geometry::Distance(polyline[i - 1], polyline[i]);
        }
        return length;
    }

    std::vector<CandidateSegment> FilterValidWalls(const std::vector<CandidateSegment>& segments, double minWallLength) {
        std::vector<CandidateSegment> walls;
        std::copy_if(segments.begin(), segments.end(), std::back_inserter(walls),
            [minWallLength](const CandidateSegment& s) { return s.length >= minWallLength; });
        return walls;
    }

    void FillLengthStats(const std::vector<CandidateSegment>& walls, ValidationStats& stats) {
        if (walls.empty()) return;
        double total = 0.0;
        stats.minWallLength = walls.front().length;
        stats.maxWallLength = walls.front().length;
        for (const CandidateSegment& wall : walls) {
            total += wall.length;
            stats.minWallLength = std::min(stats.minWallLength, wall.length);
            stats.maxWallLength = std::max(stats.maxWallLength, wall.length);
        }
        stats.averageWallLength = total / static_cast<double>(walls.size());
    }

} // anonymous namespace

double CalculateStraightness(const Polyline& polyline) {
    if (polyline.size() < 2) return 0.0;
    if (polyline.size() == 2) return 1.0;

    double direct = Geometry::Distance(polyline.front(), polyline.back());
    if (direct < 1e-6) return 0.0;

    double path = PathLength(polyline);
    if (path < 1e-6) return 0.0;
    return direct / path;
}

std::vector<CandidateSegment> ExtractLineSegments(const std::vector<Polyline>& polylines, double minWallLength, double minStraightness) {
    std::vector<CandidateSegment> segments;

    for (const Polyline& polyline : polylines) {
        if (polyline.size() < 2) continue;

        double straightness = CalculateStraightness(polyline);
        double directLength = Geometry::Distance(polyline.front(), polyline.back());
        if (straightness >= minStraightness && directLength >= minWallLength) {
            segments.push_back({ polyline.front(), polyline.back(), directLength, straightness });
            continue;
        }

        // Fragmented path: keep only the pieces that are long enough on their own.
        for (size_t i = 1; i < polyline.size(); ++i) {
            double length = Geometry::Distance(polyline[i - 1], polyline[i]);
            if (length >= minWallLength) {
                segments.push_back({ polyline[i - 1], polyline[i], length, 1.0 });
            }
        }

        if (polyline.size() >= 3) {
            double closing = Geometry::Distance(polyline.front(), polyline.back());
            if (closing < CLOSING_SEGMENT_TOLERANCE && closing >= minWallLength) {
                segments.push_back({ polyline.back(), polyline.front(), closing, 1.0 });
            }
        }
    }
    return segments;
}

size_t CountClosedLoops(const std::vector<Polyline>& polylines, double closureTolerance) {
    return static_cast<size_t>(std::count_if(polylines.begin(), polylines.end(), [closureTolerance](const Polyline& p) {
        return p.size() >= 3 && Geometry::Distance(p.front(), p.back()) <= closureTolerance;
    }));
}

ValidationResult ValidateInput(const std::vector<Polyline>& polylines, const ValidationOptions& options) {
    ValidationResult result;
    if (polylines.empty()) {
        result.error = "No polylines provided";
        return result;
    }

    const std::vector<CandidateSegment> segments = ExtractLineSegments(polylines, options.minWallLength, options.minStraightness);
    const std::vector<CandidateSegment> walls = FilterValidWalls(segments, options.minWallLength);
    const size_t closedLoops = CountClosedLoops(polylines, options.closureTolerance);

    ValidationStats& stats = result.stats;
    stats.polylineCount = polylines.size();
    stats.segmentCount = segments.size();
    stats.wallCount = walls.size();
    stats.closedLoops = closedLoops;
    FillLengthStats(walls, stats);

    std::vector<std::string> errors;
    if (walls.size() < options.minWalls) {
        errors.push_back(fmt::format("Insufficient walls: {} found, minimum {} required", walls.size(), options.minWalls));
    }
    if (closedLoops < options.minClosedLoops) {
        errors.push_back(fmt::format("No closed loops detected: {} found, minimum {} required", closedLoops, options.minClosedLoops));
    }
    if (!segments.empty() && walls.empty()) {
        errors.push_back(fmt::format("All walls rejected: {} segments found, but none meet quality criteria (minLength: {})",
                                     segments.size(), options.minWallLength));
    }

    result.valid = errors.empty();
    if (!errors.empty()) {
        result.error = fmt::format("{}", fmt::join(errors, "; "));
    }
    return result;
}

void LogInputGeometry(const std::vector<Polyline>& polylines, std::optional<double> pxToMeters) {
    fmt::print("Input Geometry:\n");
    fmt::print("   Polylines: {}\n", polylines.size());
    if (pxToMeters) {
        fmt::print("   Scale: {} m/unit\n", *pxToMeters);
    }

    const size_t sampleCount = std::min(LOGGED_POLYLINES, polylines.size());
    fmt::print("   Sample polylines (first {}):\n", sampleCount);
    for (size_t i = 0; i < sampleCount; ++i) {
        const Polyline& polyline = polylines[i];
        if (polyline.empty()) {
            fmt::print("     [{}]: empty\n", i);
            continue;
        }
        const Point2D& first = polyline.front();
        const Point2D& last = polyline.back();
        bool closed = Geometry::Distance(first, last) < CLOSING_SEGMENT_TOLERANCE;

        fmt::print("     [{}]: {} points, {:.1f} length, {}\n", i, polyline.size(), PathLength(polyline), closed ? "closed" : "open");
        fmt::print("            First: [{:.1f}, {:.1f}], Last: [{:.1f}, {:.1f}]\n", first.x, first.y, last.x, last.y);

        std::vector<std::string> points;
        for (size_t j = 0; j < std::min(LOGGED_POINTS, polyline.size()); ++j) {
            points.push_back(fmt::format("[{:.1f},{:.1f}]", polyline[j].x, polyline[j].y));
        }
        fmt::print("            Points: {}\n", fmt::join(points, ", "));
    }

    ValidationOptions defaults;
    const std::vector<CandidateSegment> segments = ExtractLineSegments(polylines, defaults.minWallLength, defaults.minStraightness);
    const std::vector<CandidateSegment> walls = FilterValidWalls(segments, defaults.minWallLength);
    ValidationStats stats;
    FillLengthStats(walls, stats);

    fmt::print("   Aggregate statistics:\n");
    fmt::print("     Total segments: {}\n", segments.size());
    fmt::print("     Valid walls (>= {}): {}\n", defaults.minWallLength, walls.size());
    fmt::print("     Closed loops: {}\n", CountClosedLoops(polylines));
    if (!walls.empty()) {
        fmt::print("     Average wall length: {:.1f}\n", stats.averageWallLength);
        fmt::print("     Min wall length: {:.1f}\n", stats.minWallLength);
        fmt::print("     Max wall length: {:.1f}\n", stats.maxWallLength);
    }
}

} // namespace Orthoplan::Engine

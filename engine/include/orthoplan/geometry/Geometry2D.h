#pragma once

#include <optional>
#include <vector>
#include "orthoplan/line.h"

// Planar helpers shared by every cleanup stage.
// Angles are in radians; LineAngle() returns values in [0, 2*pi).
namespace Orthoplan::Engine::Geometry {

    // Segments shorter than this are considered degenerate.
    constexpr double MIN_SEGMENT_LENGTH = 0.001;

    double Distance(const Point2D& a, const Point2D& b);
    double LineLength(const Point2D& start, const Point2D& end);
    double LineLength(const Segment& segment);
    double LineAngle(const Point2D& start, const Point2D& end);
    double LineAngle(const Segment& segment);
    Point2D Midpoint(const Point2D& a, const Point2D& b);
    Point2D Midpoint(const Segment& segment);

    // Projection clamped to the segment [lineStart, lineEnd]. A zero-length segment
    // projects everything onto its start point.
    Point2D ProjectPointOnSegment(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd);
    // Projection onto the infinite line through lineStart and lineEnd.
    Point2D ProjectPointOnLine(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd);
    // Positive when the point lies to the left of lineStart->lineEnd.
    double SignedPerpendicularDistance(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd);
    double PerpendicularDistance(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd);

    std::optional<Point2D> IntersectSegments(const Point2D& a1, const Point2D& a2, const Point2D& b1, const Point2D& b2);
    std::optional<Point2D> IntersectLines(const Point2D& a1, const Point2D& a2, const Point2D& b1, const Point2D& b2);

    double NormalizeAngle(double angle);     // -> [0, 2*pi)
    double NormalizeAngleDiff(double diff);  // -> [0, pi], positive multiples of pi map to pi

    // Undirected angular equivalence: a1 ~ a2 if they differ by less than tolerance modulo pi.
    bool AreAnglesParallel(double angle1, double angle2, double tolerance);
    bool IsParallel(const Segment& a, const Segment& b, double tolerance = 0.01);

    double SignedArea(const std::vector<Point2D>& polygon);
    double PolygonArea(const std::vector<Point2D>& polygon);

    // Douglas-Peucker.
    std::vector<Point2D> SimplifyPolyline(const std::vector<Point2D>& points, double tolerance = 1.0);

    bool IsFinite(const Point2D& point);
    bool IsValidSegment(const Segment& segment);

    // Rounds half away from negative infinity, matching the tracer's integer rounding.
    double RoundHalfUp(double value);
    Point2D SnapPointToGrid(const Point2D& point, double gridSize);

} // namespace Orthoplan::Engine::Geometry

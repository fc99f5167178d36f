#include "orthoplan/geometry/Geometry2D.h"
#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace {
    const double LINE_EPSILON = 1e-10;
}

namespace Orthoplan::Engine::Geometry {

    double Distance(const Point2D& a, const Point2D& b) {
        return glm::distance(a, b);
    }

    double LineLength(const Point2D& start, const Point2D& end) {
        return Distance(start, end);
    }

    double LineLength(const Segment& segment) {
        return Distance(segment.start, segment.end);
    }

    double LineAngle(const Point2D& start, const Point2D& end) {
        double angle = std::atan2(end.y - start.y, end.x - start.x);
        return angle < 0.0 ? angle + glm::two_pi<double>() : angle;
    }

    double LineAngle(const Segment& segment) {
        return LineAngle(segment.start, segment.end);
    }

    Point2D Midpoint(const Point2D& a, const Point2D& b) {
        return Point2D((a.x + b.x) / 2.0, (a.y + b.y) / 2.0);
    }

    Point2D Midpoint(const Segment& segment) {
        return Midpoint(segment.start, segment.end);
    }

    Point2D ProjectPointOnSegment(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd) {
        Point2D d = lineEnd - lineStart;
        double lengthSq = glm::dot(d, d);
        if (lengthSq < LINE_EPSILON) {
            return lineStart;
        }
        double t = glm::dot(point - lineStart, d) / lengthSq;
        t = std::max(0.0, std::min(1.0, t));
        return lineStart + t * d;
    }

    Point2D ProjectPointOnLine(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd) {
        Point2D d = lineEnd - lineStart;
        double lengthSq = glm::dot(d, d);
        if (lengthSq < LINE_EPSILON) {
            return lineStart;
        }
        double t = glm::dot(point - lineStart, d) / lengthSq;
        return lineStart + t * d;
    }

    double SignedPerpendicularDistance(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd) {
        Point2D d = lineEnd - lineStart;
        double length = glm::length(d);
        if (length < MIN_SEGMENT_LENGTH) {
            return Distance(point, lineStart);
        }
        Point2D v = point - lineStart;
        // 2D cross product: d x v
        return (d.x * v.y - d.y * v.x) / length;
    }

    double PerpendicularDistance(const Point2D& point, const Point2D& lineStart, const Point2D& lineEnd) {
        return Distance(point, ProjectPointOnLine(point, lineStart, lineEnd));
    }

    std::optional<Point2D> IntersectSegments(const Point2D& a1, const Point2D& a2, const Point2D& b1, const Point2D& b2) {
        double denom = (a1.x - a2.x) * (b1.y - b2.y) - (a1.y - a2.y) * (b1.x - b2.x);
        if (std::abs(denom) < LINE_EPSILON) {
            return std::nullopt; // Parallel or coincident
        }

        double t = ((a1.x - b1.x) * (b1.y - b2.y) - (a1.y - b1.y) * (b1.x - b2.x)) / denom;
        double u = -((a1.x - a2.x) * (a1.y - b1.y) - (a1.y - a2.y) * (a1.x - b1.x)) / denom;

        if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
            return std::nullopt;
        }
        return a1 + t * (a2 - a1);
    }

    std::optional<Point2D> IntersectLines(const Point2D& a1, const Point2D& a2, const Point2D& b1, const Point2D& b2) {
        double denom = (a1.x - a2.x) * (b1.y - b2.y) - (a1.y - a2.y) * (b1.x - b2.x);
        if (std::abs(denom) < LINE_EPSILON) {
            return std::nullopt;
        }
        double t = ((a1.x - b1.x) * (b1.y - b2.y) - (a1.y - b1.y) * (b1.x - b2.x)) / denom;
        return a1 + t * (a2 - a1);
    }

    double NormalizeAngle(double angle) {
        if (!std::isfinite(angle)) {
            return angle;
        }
        const double twoPi = glm::two_pi<double>();
        double normalized = std::fmod(angle, twoPi);
        if (normalized < 0.0) {
            normalized += twoPi;
        }
        if (normalized >= twoPi) {
            normalized = 0.0;
        }
        return normalized;
    }

    double NormalizeAngleDiff(double diff) {
        if (!std::isfinite(diff)) {
            return diff;
        }
        const double pi = glm::pi<double>();
        double normalized = std::fmod(diff, pi);
        if (normalized < 0.0) {
            normalized += pi;
        }
        if (normalized == 0.0 && diff > 0.0) {
            normalized = pi;
        }
        return normalized;
    }

    bool AreAnglesParallel(double angle1, double angle2, double tolerance) {
        double diff = std::abs(NormalizeAngleDiff(angle1 - angle2));
        return diff < tolerance || std::abs(diff - glm::pi<double>()) < tolerance;
    }

    bool IsParallel(const Segment& a, const Segment& b, double tolerance) {
        return AreAnglesParallel(LineAngle(a), LineAngle(b), tolerance);
    }

    double SignedArea(const std::vector<Point2D>& polygon) {
        if (polygon.size() < 3) {
            return 0.0;
        }
        double area = 0.0;
        for (size_t i = 0; i < polygon.size(); ++i) {
            const Point2D& p = polygon[i];
            const Point2D& q = polygon[(i + 1) % polygon.size()];
            area += p.x * q.y;
            area -= q.x * p.y;
        }
        return area / 2.0;
    }

    double PolygonArea(const std::vector<Point2D>& polygon) {
        return std::abs(SignedArea(polygon));
    }

    std::vector<Point2D> SimplifyPolyline(const std::vector<Point2D>& points, double tolerance) {
        if (points.size() <= 2) {
            return points;
        }

        const Point2D& first = points.front();
        const Point2D& last = points.back();
        double maxDistance = 0.0;
        size_t maxIndex = 0;

        for (size_t i = 1; i + 1 < points.size(); ++i) {
            double d = Distance(points[i], ProjectPointOnSegment(points[i], first, last));
            if (d > maxDistance) {
                maxDistance = d;
                maxIndex = i;
            }
        }

        if (maxDistance <= tolerance) {
            return { first, last };
        }

        std::vector<Point2D> left(points.begin(), points.begin() + maxIndex + 1);
        std::vector<Point2D> right(points.begin() + maxIndex, points.end());
        std::vector<Point2D> result = SimplifyPolyline(left, tolerance);
        std::vector<Point2D> rightSimplified = SimplifyPolyline(right, tolerance);
        result.pop_back(); // junction point is repeated at the head of the right half
        result.insert(result.end(), rightSimplified.begin(), rightSimplified.end());
        return result;
    }

    bool IsFinite(const Point2D& point) {
        return std::isfinite(point.x) && std::isfinite(point.y);
    }

    bool IsValidSegment(const Segment& segment) {
        if (!IsFinite(segment.start) || !IsFinite(segment.end)) {
            return false;
        }
        return LineLength(segment) >= MIN_SEGMENT_LENGTH;
    }

    double RoundHalfUp(double value) {
        return std::floor(value + 0.5);
    }

    Point2D SnapPointToGrid(const Point2D& point, double gridSize) {
        if (gridSize <= 0.0) {
            return point;
        }
        return Point2D(RoundHalfUp(point.x / gridSize) * gridSize, RoundHalfUp(point.y / gridSize) * gridSize);
    }

} // namespace Orthoplan::Engine::Geometry

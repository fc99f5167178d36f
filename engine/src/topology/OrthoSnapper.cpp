#include "orthoplan/topology/OrthoSnapper.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace {
    using Orthoplan::Engine::Point2D;

    // Exact unit directions so that snapped segments are perfectly axis aligned.
    const Point2D ORTHO_DIRECTIONS[4] = {
        Point2D( 1.0,  0.0),
        Point2D( 0.0,  1.0),
        Point2D(-1.0,  0.0),
        Point2D( 0.0, -1.0)
    };

    const double HALF_SQRT2 = 0.70710678118654752440;
    const Point2D DIAGONAL_DIRECTIONS[4] = {
        Point2D( HALF_SQRT2,  HALF_SQRT2),
        Point2D(-HALF_SQRT2,  HALF_SQRT2),
        Point2D(-HALF_SQRT2, -HALF_SQRT2),
        Point2D( HALF_SQRT2, -HALF_SQRT2)
    };

    double DegToRad(double degrees) {
        return degrees * glm::pi<double>() / 180.0;
    }

    // Circular distance between two angles, in [0, pi].
    double AngularDistance(double a, double b) {
        const double twoPi = glm::two_pi<double>();
        double diff = std::min({ std::abs(a - b), std::abs(a - (b + twoPi)), std::abs(a - (b - twoPi)) });
        return std::min(diff, twoPi - diff);
    }

    bool IsSnappable(const Orthoplan::Engine::Segment& line) {
        return Orthoplan::Engine::Geometry::IsValidSegment(line);
    }
}

namespace Orthoplan::Engine {

    OrthoSnapper::OrthoSnapper(const SnapOptions& options) : options_(options) {}

    std::vector<Segment> OrthoSnapper::Snap(const std::vector<Segment>& lines) const {
        std::vector<Segment> snapped;
        snapped.reserve(lines.size());
        const double tolerance = DegToRad(options_.toleranceDeg);

        for (const auto& line : lines) {
            Segment current = line;
            if (options_.snapToGrid && options_.gridSize > 0.0 && Geometry::IsFinite(line.start) && Geometry::IsFinite(line.end)) {
                current.start = Geometry::SnapPointToGrid(line.start, options_.gridSize);
                current.end = Geometry::SnapPointToGrid(line.end, options_.gridSize);
            }

            if (auto orthogonal = SnapLineToOrthogonal(current, tolerance)) {
                snapped.push_back(*orthogonal);
                continue;
            }
            if (options_.use45Deg) {
                if (auto diagonal = SnapLineTo45(current, tolerance)) {
                    snapped.push_back(*diagonal);
                    continue;
                }
            }
            snapped.push_back(current);
        }
        return snapped;
    }

    double OrthoSnapper::SnapAngleToOrthogonal(double angle) {
        double degrees = Geometry::NormalizeAngle(angle) * 180.0 / glm::pi<double>();
        int quarter = static_cast<int>(Geometry::RoundHalfUp(degrees / 90.0)) % 4;
        return DegToRad(quarter * 90.0);
    }

    std::optional<double> OrthoSnapper::SnapAngleWithTolerance(double angle, double toleranceRad) {
        if (!std::isfinite(angle)) {
            return std::nullopt;
        }
        double normalized = Geometry::NormalizeAngle(angle);
        double orthogonal = SnapAngleToOrthogonal(normalized);
        if (AngularDistance(normalized, orthogonal) <= toleranceRad) {
            return orthogonal;
        }
        return std::nullopt;
    }

    std::optional<Segment> OrthoSnapper::SnapLineToOrthogonal(const Segment& line, double toleranceRad) {
        if (!IsSnappable(line)) {
            return std::nullopt;
        }
        double normalized = Geometry::LineAngle(line);
        double degrees = normalized * 180.0 / glm::pi<double>();
        int quarter = static_cast<int>(Geometry::RoundHalfUp(degrees / 90.0)) % 4;
        if (AngularDistance(normalized, DegToRad(quarter * 90.0)) > toleranceRad) {
            return std::nullopt;
        }

        double length = Geometry::LineLength(line);
        Segment result = line;
        result.end = line.start + length * ORTHO_DIRECTIONS[quarter];
        return result;
    }

    std::optional<Segment> OrthoSnapper::SnapLineTo45(const Segment& line, double toleranceRad) {
        if (!IsSnappable(line)) {
            return std::nullopt;
        }
        double normalized = Geometry::LineAngle(line);
        for (int i = 0; i < 4; ++i) {
            double target = glm::quarter_pi<double>() + i * glm::half_pi<double>();
            if (AngularDistance(normalized, target) <= toleranceRad) {
                Segment result = line;
                result.end = line.start + Geometry::LineLength(line) * DIAGONAL_DIRECTIONS[i];
                return result;
            }
        }
        return std::nullopt;
    }

    AngleBuckets OrthoSnapper::BucketAngles(const std::vector<double>& angles, double toleranceRad) {
        AngleBuckets buckets;
        for (size_t i = 0; i < angles.size(); ++i) {
            auto snapped = SnapAngleWithTolerance(angles[i], toleranceRad);
            if (!snapped) {
                continue;
            }
            int slot = static_cast<int>(Geometry::RoundHalfUp(*snapped * 180.0 / glm::pi<double>())) % 360 / 90;
            buckets[slot].push_back({ i, angles[i], *snapped });
        }
        return buckets;
    }

    std::optional<double> OrthoSnapper::GetDominantOrthogonalDirection(const std::vector<Segment>& lines, double toleranceRad) {
        std::vector<double> angles;
        angles.reserve(lines.size());
        for (const auto& line : lines) {
            if (Geometry::IsFinite(line.start) && Geometry::IsFinite(line.end)) {
                angles.push_back(Geometry::LineAngle(line));
            }
        }
        if (angles.empty()) {
            return std::nullopt;
        }

        AngleBuckets buckets = BucketAngles(angles, toleranceRad);
        size_t bestCount = 0;
        int bestSlot = -1;
        for (int slot = 0; slot < 4; ++slot) {
            if (buckets[slot].size() > bestCount) {
                bestCount = buckets[slot].size();
                bestSlot = slot;
            }
        }
        if (bestSlot < 0) {
            return std::nullopt;
        }
        return DegToRad(bestSlot * 90.0);
    }

    std::vector<Segment> SnapLines(const std::vector<Segment>& lines, const SnapOptions& options) {
        return OrthoSnapper(options).Snap(lines);
    }

    std::vector<Segment> SnapToOrthogonal(const std::vector<Segment>& lines, double toleranceRad, double gridSize) {
        SnapOptions options;
        options.toleranceDeg = toleranceRad * 180.0 / glm::pi<double>();
        options.snapToGrid = gridSize > 0.0;
        options.gridSize = gridSize;
        return OrthoSnapper(options).Snap(lines);
    }

} // namespace Orthoplan::Engine

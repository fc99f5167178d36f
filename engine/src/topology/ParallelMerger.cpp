#include "orthoplan/topology/ParallelMerger.h"
#include "orthoplan/geometry/Geometry2D.h"
#include "orthoplan/Diagnostics.h"
#include <glm/geometric.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Orthoplan::Engine {

namespace {
    const double MAX_REASONABLE_DISTANCE = 1e10;

    bool SameGeometry(const Segment& a, const Segment& b) {
        return a.start == b.start && a.end == b.end;
    }
}

ParallelMerger::ParallelMerger(const ParallelMergeOptions& options) : options_(options) {}

std::vector<Segment> ParallelMerger::Merge(const std::vector<Segment>& lines, DiagnosticLog* diagnostics) const {
    DiagnosticLog fallbackLog;
    DiagnosticLog& log = diagnostics ? *diagnostics : fallbackLog;

    std::vector<Segment> validLines;
    validLines.reserve(lines.size());
    for (const auto& line : lines) {
        if (Geometry::IsValidSegment(line)) {
            validLines.push_back(line);
        }
    }
    if (validLines.size() != lines.size()) {
        log.Info(DiagnosticCode::INVALID_INPUT_DROPPED,
            fmt::format("ParallelMerger: dropped {} degenerate segment(s)", lines.size() - validLines.size()));
    }
    if (validLines.empty()) {
        return {};
    }

    std::vector<Segment> merged;
    merged.reserve(validLines.size());

    for (const auto& group : GroupParallelLines(validLines, options_.angleTolerance)) {
        if (group.size() == 1) {
            merged.push_back(group.front());
            continue;
        }
        if (group.size() > options_.maxGroupSize) {
            log.Warn(DiagnosticCode::PARALLEL_GROUP_TOO_LARGE,
                fmt::format("ParallelMerger: parallel group too large ({} lines), skipping merge", group.size()));
            merged.insert(merged.end(), group.begin(), group.end());
            continue;
        }

        const size_t pairCount = group.size() * (group.size() - 1) / 2;
        if (pairCount > options_.maxComparisons) {
            log.Warn(DiagnosticCode::COMPARISON_LIMIT_EXCEEDED,
                fmt::format("ParallelMerger: group of {} lines needs {} comparisons (limit {}), skipping merge",
                            group.size(), pairCount, options_.maxComparisons));
            merged.insert(merged.end(), group.begin(), group.end());
            continue;
        }

        if (IsGroupWithinTolerance(group, log)) {
            merged.push_back(CalculateMedianMergedLine(group));
        } else {
            merged.insert(merged.end(), group.begin(), group.end());
        }
    }

    return merged;
}

bool ParallelMerger::IsGroupWithinTolerance(const std::vector<Segment>& group, DiagnosticLog& diagnostics) const {
    double maxDistance = 0.0;
    for (size_t i = 0; i < group.size(); ++i) {
        for (size_t j = i + 1; j < group.size(); ++j) {
            try {
                double dist = DistanceBetweenParallelLines(group[i], group[j]);
                if (dist < MAX_REASONABLE_DISTANCE) {
                    maxDistance = std::max(maxDistance, dist);
                }
            } catch (const std::exception& e) {
                diagnostics.Warn(DiagnosticCode::DISTANCE_CALCULATION_FAILED,
                    fmt::format("ParallelMerger: skipping pair ({}, {}): {}", i, j, e.what()));
            }
        }
    }
    return maxDistance <= options_.distanceTolerance;
}

std::vector<std::vector<Segment>> ParallelMerger::GroupParallelLines(const std::vector<Segment>& lines, double angleTolerance) {
    std::vector<std::vector<Segment>> groups;
    std::vector<bool> used(lines.size(), false);

    for (size_t i = 0; i < lines.size(); ++i) {
        if (used[i]) continue;

        std::vector<Segment> group = { lines[i] };
        used[i] = true;
        const double angle1 = Geometry::LineAngle(lines[i]);

        for (size_t j = i + 1; j < lines.size(); ++j) {
            if (used[j]) continue;
            if (Geometry::AreAnglesParallel(angle1, Geometry::LineAngle(lines[j]), angleTolerance)) {
                group.push_back(lines[j]);
                used[j] = true;
            }
        }
        groups.push_back(std::move(group));
    }
    return groups;
}

double ParallelMerger::DistanceBetweenParallelLines(const Segment& a, const Segment& b) {
    if (!Geometry::IsFinite(a.start) || !Geometry::IsFinite(a.end) ||
        !Geometry::IsFinite(b.start) || !Geometry::IsFinite(b.end)) {
        throw std::invalid_argument("Invalid line parameters");
    }
    if (Geometry::LineLength(b) < Geometry::MIN_SEGMENT_LENGTH) {
        throw std::invalid_argument("Reference line is degenerate");
    }

    Point2D mid = Geometry::Midpoint(a);
    double dist = Geometry::PerpendicularDistance(mid, b.start, b.end);
    if (!std::isfinite(dist) || dist < 0.0) {
        throw std::runtime_error(fmt::format("Invalid distance calculated: {}", dist));
    }
    return dist;
}

Segment ParallelMerger::CalculateMedianMergedLine(const std::vector<Segment>& group) {
    if (group.empty()) {
        throw std::invalid_argument("Cannot merge empty array of lines");
    }
    if (group.size() == 1) {
        return group.front();
    }

    // Longest member is the reference axis; the first one wins ties.
    size_t referenceIndex = 0;
    double longest = Geometry::LineLength(group[0]);
    for (size_t i = 1; i < group.size(); ++i) {
        double length = Geometry::LineLength(group[i]);
        if (length > longest) {
            longest = length;
            referenceIndex = i;
        }
    }
    const Segment& reference = group[referenceIndex];

    std::vector<Segment> others;
    for (size_t i = 0; i < group.size(); ++i) {
        if (i == referenceIndex || SameGeometry(group[i], reference)) continue;
        others.push_back(group[i]);
    }

    // Extent of every endpoint along the reference direction.
    const Point2D dir = glm::normalize(reference.end - reference.start);
    double minT = 0.0;
    double maxT = glm::dot(reference.end - reference.start, dir);
    for (const auto& line : others) {
        for (const Point2D& p : { line.start, line.end }) {
            double t = glm::dot(p - reference.start, dir);
            minT = std::min(minT, t);
            maxT = std::max(maxT, t);
        }
    }

    Segment extended = reference;
    extended.start = reference.start + minT * dir;
    extended.end = reference.start + maxT * dir;

    if (others.empty()) {
        return extended;
    }

    std::vector<double> offsets;
    offsets.reserve(others.size());
    for (const auto& line : others) {
        offsets.push_back(Geometry::SignedPerpendicularDistance(Geometry::Midpoint(line), extended.start, extended.end));
    }
    const double medianOffset = Median(offsets);

    const Point2D normal(-dir.y, dir.x); // left of the reference direction
    extended.start += medianOffset * normal;
    extended.end += medianOffset * normal;
    return extended;
}

std::vector<std::pair<size_t, size_t>> ParallelMerger::DetectParallel(const std::vector<Segment>& lines, double angleTolerance) {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < lines.size(); ++i) {
        for (size_t j = i + 1; j < lines.size(); ++j) {
            if (Geometry::IsParallel(lines[i], lines[j], angleTolerance)) {
                pairs.emplace_back(i, j);
            }
        }
    }
    return pairs;
}

std::vector<Segment> MergeParallel(const std::vector<Segment>& lines,
                                   const ParallelMergeOptions& options,
                                   DiagnosticLog* diagnostics) {
    return ParallelMerger(options).Merge(lines, diagnostics);
}

double Median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    if (values.size() == 1) return values.front();

    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    }
    return values[mid];
}

} // namespace Orthoplan::Engine

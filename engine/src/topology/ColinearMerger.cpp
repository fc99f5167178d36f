#include "orthoplan/topology/ColinearMerger.h"
#include "orthoplan/topology/ParallelMerger.h"
#include "orthoplan/geometry/Geometry2D.h"
#include <glm/geometric.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace Orthoplan::Engine {

ColinearMerger::ColinearMerger(const ColinearMergeOptions& options) : options_(options) {}

std::vector<Segment> ColinearMerger::Merge(const std::vector<Segment>& lines) const {
    if (lines.size() < 2) {
        return lines;
    }

    std::vector<Segment> merged;
    merged.reserve(lines.size());

    for (const auto& group : ParallelMerger::GroupParallelLines(lines, options_.angleTolerance)) {
        if (group.size() == 1) {
            merged.push_back(group.front());
            continue;
        }

        std::vector<Segment> sorted = SortAlongDirection(group);
        const double refAngle = Geometry::LineAngle(group.front());
        const Point2D dir(std::cos(refAngle), std::sin(refAngle));

        Segment current = sorted.front();
        for (size_t i = 1; i < sorted.size(); ++i) {
            const Segment& next = sorted[i];
            if (GapBetween(current, next) <= options_.distance) {
                // Keep whichever end reaches further along the sweep direction.
                if (glm::dot(next.end - current.start, dir) > glm::dot(current.end - current.start, dir)) {
                    current.end = next.end;
                }
            } else {
                merged.push_back(current);
                current = next;
            }
        }
        merged.push_back(current);
    }

    return merged;
}

std::vector<Segment> ColinearMerger::SortAlongDirection(const std::vector<Segment>& group) {
    if (group.empty()) {
        return {};
    }

    const double refAngle = Geometry::LineAngle(group.front());
    const Point2D dir(std::cos(refAngle), std::sin(refAngle));

    std::vector<std::pair<double, Segment>> withProjection;
    withProjection.reserve(group.size());
    for (const auto& segment : group) {
        Segment oriented = segment;
        if (glm::dot(segment.end - segment.start, dir) < 0.0) {
            std::swap(oriented.start, oriented.end);
        }
        withProjection.emplace_back(glm::dot(Geometry::Midpoint(segment), dir), oriented);
    }

    std::stable_sort(withProjection.begin(), withProjection.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Segment> sorted;
    sorted.reserve(withProjection.size());
    for (auto& item : withProjection) {
        sorted.push_back(item.second);
    }
    return sorted;
}

double ColinearMerger::GapBetween(const Segment& running, const Segment& next) {
    const Point2D d = running.end - running.start;
    if (glm::dot(next.start - running.end, d) >= 0.0) {
        return Geometry::Distance(running.end, next.start);
    }
    return Geometry::PerpendicularDistance(next.start, running.start, running.end);
}

std::vector<Segment> MergeColinearSegments(const std::vector<Segment>& lines, const ColinearMergeOptions& options) {
    return ColinearMerger(options).Merge(lines);
}

} // namespace Orthoplan::Engine

#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    class DiagnosticLog;

    struct ParallelMergeOptions {
        double angleTolerance = 0.05;   // radians, ~2.9 degrees
        double distanceTolerance = 5.0;
        size_t maxGroupSize = 1000;     // larger groups are passed through unmerged
        size_t maxComparisons = 10000;  // pairwise checks allowed per group
    };

    // Fuses bundles of near-parallel traces (typically the two sides of a hand-drawn
    // wall stroke) into a single segment.
    //
    // Grouping is single-linkage and first-seen greedy: a segment joins the group of the
    // first earlier segment whose angle matches. A group is fused only if every pair of
    // members is within distanceTolerance; otherwise its members are emitted unchanged.
    // The fused segment spans the extent of all members along the longest member and is
    // offset by the median signed distance of the other members' midpoints.
    class ParallelMerger {
    public:
        explicit ParallelMerger(const ParallelMergeOptions& options = {});

        std::vector<Segment> Merge(const std::vector<Segment>& lines, DiagnosticLog* diagnostics = nullptr) const;

        static std::vector<std::vector<Segment>> GroupParallelLines(const std::vector<Segment>& lines, double angleTolerance);

        // Distance from the midpoint of a to the infinite line through b.
        // Throws std::invalid_argument for degenerate input and std::runtime_error
        // when the result is not a finite distance.
        static double DistanceBetweenParallelLines(const Segment& a, const Segment& b);

        // Throws std::invalid_argument on an empty group.
        static Segment CalculateMedianMergedLine(const std::vector<Segment>& group);

        // Index pairs (i < j) of parallel segments; nothing is merged.
        static std::vector<std::pair<size_t, size_t>> DetectParallel(const std::vector<Segment>& lines, double angleTolerance = 0.05);

    private:
        bool IsGroupWithinTolerance(const std::vector<Segment>& group, DiagnosticLog& diagnostics) const;

        ParallelMergeOptions options_;
    };

    std::vector<Segment> MergeParallel(const std::vector<Segment>& lines,
                                       const ParallelMergeOptions& options = {},
                                       DiagnosticLog* diagnostics = nullptr);

    // Median of the values; 0 for an empty list, mean of the middle pair for even sizes.
    double Median(std::vector<double> values);

} // namespace Orthoplan::Engine

#pragma once

#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct ColinearMergeOptions {
        double distance = 10.0;         // largest gap that is closed
        double angleTolerance = 0.01;   // radians
    };

    // Joins segments lying on the same line when the gap between them is small.
    //
    // Members of a direction group are ordered by the projection of their midpoints onto
    // the FIRST member's direction and swept once from left to right: the running segment
    // absorbs the next one if the gap is within distance, otherwise it is flushed.
    class ColinearMerger {
    public:
        explicit ColinearMerger(const ColinearMergeOptions& options = {});

        std::vector<Segment> Merge(const std::vector<Segment>& lines) const;

        // Group members sorted along the first member's direction and oriented so that
        // each start precedes its end along that direction.
        static std::vector<Segment> SortAlongDirection(const std::vector<Segment>& group);

        // Gap between the running segment and the next one. If the next one starts before
        // the running end (overlap) this is its offset from the running line.
        static double GapBetween(const Segment& running, const Segment& next);

    private:
        ColinearMergeOptions options_;
    };

    std::vector<Segment> MergeColinearSegments(const std::vector<Segment>& lines, const ColinearMergeOptions& options = {});

} // namespace Orthoplan::Engine

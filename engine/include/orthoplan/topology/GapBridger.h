#pragma once

#include <vector>
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    struct GapBridgeOptions {
        double maxGap = 5.0;
        double angleTolerance = 0.1; // radians, orientation compatibility
    };

    // Connects segments whose endpoints nearly touch and whose directions agree.
    // Each segment takes part in at most one bridge per call; the bridged segment
    // replaces the first partner and the second one is dropped.
    class GapBridger {
    public:
        explicit GapBridger(const GapBridgeOptions& options = {});

        std::vector<Segment> Bridge(const std::vector<Segment>& lines) const;

        // Segment spanning the two endpoints that are NOT being connected.
        static Segment ConnectLines(const Segment& line1, const Segment& line2, bool line1AtStart, bool line2AtStart);

    private:
        GapBridgeOptions options_;
    };

    std::vector<Segment> BridgeGaps(const std::vector<Segment>& lines, const GapBridgeOptions& options = {});

} // namespace Orthoplan::Engine

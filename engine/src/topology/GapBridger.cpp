#include "orthoplan/topology/GapBridger.h"
#include "orthoplan/geometry/GridIndex.h"
#include "orthoplan/geometry/Geometry2D.h"

namespace Orthoplan::Engine {

GapBridger::GapBridger(const GapBridgeOptions& options) : options_(options) {}

std::vector<Segment> GapBridger::Bridge(const std::vector<Segment>& lines) const {
    if (lines.size() < 2) {
        return lines;
    }

    // Endpoint index on rounded integer coordinates.
    GridIndex endpoints(1.0);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!Geometry::IsFinite(lines[i].start) || !Geometry::IsFinite(lines[i].end)) continue;
        endpoints.Insert({ lines[i].start, i, true });
        endpoints.Insert({ lines[i].end, i, false });
    }

    std::vector<Segment> result = lines;
    std::vector<bool> consumed(lines.size(), false); // absorbed into another segment
    std::vector<bool> extended(lines.size(), false); // already grown by one bridge

    for (size_t i = 0; i < result.size(); ++i) {
        if (consumed[i] || extended[i]) continue;

        const Segment line1 = result[i];
        const double angle1 = Geometry::LineAngle(line1);
        bool bridged = false;

        for (bool atStart : { true, false }) {
            const Point2D& endpoint = atStart ? line1.start : line1.end;

            for (size_t entryId : endpoints.Query(endpoint, options_.maxGap)) {
                const GridEntry& match = endpoints.GetEntry(entryId);
                if (match.owner == i || consumed[match.owner] || extended[match.owner]) continue;

                // Touching endpoints are already connected.
                if (Geometry::Distance(endpoint, match.point) <= 0.0) continue;

                const Segment& line2 = result[match.owner];
                if (!Geometry::AreAnglesParallel(angle1, Geometry::LineAngle(line2), options_.angleTolerance)) continue;

                result[i] = ConnectLines(line1, line2, atStart, match.isStart);
                consumed[match.owner] = true;
                extended[i] = true;
                bridged = true;
                break;
            }
            if (bridged) break;
        }
    }

    std::vector<Segment> remaining;
    remaining.reserve(result.size());
    for (size_t i = 0; i < result.size(); ++i) {
        if (!consumed[i]) {
            remaining.push_back(result[i]);
        }
    }
    return remaining;
}

Segment GapBridger::ConnectLines(const Segment& line1, const Segment& line2, bool line1AtStart, bool line2AtStart) {
    Segment connected = line1;
    if (line1AtStart && line2AtStart) {
        connected.start = line2.end;
        connected.end = line1.end;
    } else if (line1AtStart) {
        connected.start = line2.start;
        connected.end = line1.end;
    } else if (line2AtStart) {
        connected.start = line1.start;
        connected.end = line2.end;
    } else {
        connected.start = line1.start;
        connected.end = line2.start;
    }
    return connected;
}

std::vector<Segment> BridgeGaps(const std::vector<Segment>& lines, const GapBridgeOptions& options) {
    return GapBridger(options).Bridge(lines);
}

} // namespace Orthoplan::Engine

#pragma once

#include <memory>
#include <optional>
#include <vector>
#include "orthoplan/architecture.h"
#include "orthoplan/line.h"

namespace Orthoplan::Engine {

    class DiagnosticLog;

    enum class LoopPolicy {
        ALL_LOOPS,          // every independent closed loop (room detection)
        LARGEST_LOOP_ONLY   // the biggest wall cycle (building footprint)
    };

    struct LoopDetectionOptions {
        double minArea = 100.0;        // loops below this absolute area are discarded
        double maxGap = 5.0;           // a walk closes when it returns this close to its start
        double gridTolerance = 5.0;    // endpoints collapse onto a grid of this size
        int maxDepth = 50;             // DFS recursion bound
        size_t maxExpansions = 100000; // DFS steps allowed per start node
    };

    // Interface for the cycle-search rules. Each implementation keeps its own traversal
    // and tie-break order.
    class ILoopStrategy {
    public:
        virtual ~ILoopStrategy() = default;

        virtual std::vector<Room> FindLoops(const std::vector<Segment>& segments, DiagnosticLog& diagnostics) const = 0;
        virtual const char* GetName() const = 0;
    };

    // Shared-grid adjacency graph over segment endpoints. From each unvisited node a DFS
    // follows the first usable neighbour (never back to the previous point, never over a
    // segment consumed by an earlier loop). Segments of every closed loop are consumed.
    class SegmentGraphLoopStrategy : public ILoopStrategy {
    public:
        explicit SegmentGraphLoopStrategy(const LoopDetectionOptions& options);

        std::vector<Room> FindLoops(const std::vector<Segment>& segments, DiagnosticLog& diagnostics) const override;
        const char* GetName() const override { return "SegmentGraph"; }

    private:
        LoopDetectionOptions options_;
    };

    // Walls are snapped endpoint by endpoint, then a DFS without immediate backtracking
    // returns the first cycle found from each start that no earlier search has entered.
    class WallCycleLoopStrategy : public ILoopStrategy {
    public:
        explicit WallCycleLoopStrategy(const LoopDetectionOptions& options);

        std::vector<Room> FindLoops(const std::vector<Segment>& segments, DiagnosticLog& diagnostics) const override;
        const char* GetName() const override { return "WallCycle"; }

    private:
        LoopDetectionOptions options_;
    };

    class LoopDetector {
    public:
        explicit LoopDetector(LoopPolicy policy = LoopPolicy::ALL_LOOPS, const LoopDetectionOptions& options = {});
        ~LoopDetector();

        LoopDetector(const LoopDetector&) = delete;
        LoopDetector& operator=(const LoopDetector&) = delete;
        LoopDetector(LoopDetector&&) = default;
        LoopDetector& operator=(LoopDetector&&) = default;

        std::vector<Room> Detect(const std::vector<Segment>& segments, DiagnosticLog* diagnostics = nullptr) const;

        LoopPolicy GetPolicy() const { return policy_; }
        const LoopDetectionOptions& GetOptions() const { return options_; }

    private:
        LoopPolicy policy_;
        LoopDetectionOptions options_;
        std::unique_ptr<ILoopStrategy> strategy_;
    };

    // Room detection over cleaned segments (ALL_LOOPS).
    std::vector<Room> DetectRooms(const std::vector<Segment>& lines, double minArea = 100.0, double maxGap = 5.0,
                                  DiagnosticLog* diagnostics = nullptr);

    // Every wall cycle (WallCycleLoopStrategy), unfiltered by size rank.
    std::vector<Room> FindClosedLoops(const std::vector<Wall>& walls, double minArea = 1000.0, double tolerance = 5.0);

    // Loop with the largest absolute area; the first one wins ties.
    std::optional<Room> SelectLargestLoop(const std::vector<Room>& loops);

} // namespace Orthoplan::Engine

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace Orthoplan::Engine {

    enum class DiagnosticCode {
        INVALID_INPUT_DROPPED,       // non-finite or degenerate element removed
        PARALLEL_GROUP_TOO_LARGE,    // group passed through unmerged
        COMPARISON_LIMIT_EXCEEDED,   // pairwise check budget exhausted, group passed through
        DISTANCE_CALCULATION_FAILED, // one pair skipped during the pairwise check
        LOOP_SEARCH_TRUNCATED        // DFS hit its depth bound
    };

    enum class DiagnosticSeverity {
        INFO,
        WARNING
    };

    struct Diagnostic {
        DiagnosticCode code;
        DiagnosticSeverity severity;
        std::string message;
    };

    // Collects soft-degradation records produced during one cleanup call.
    // If a callback is installed every record is forwarded to it as well; otherwise
    // warnings are echoed to std::cerr.
    class DiagnosticLog {
    public:
        using Callback = std::function<void(const Diagnostic&)>;

        DiagnosticLog() = default;
        explicit DiagnosticLog(Callback callback);

        void Report(DiagnosticCode code, DiagnosticSeverity severity, const std::string& message);
        void Warn(DiagnosticCode code, const std::string& message);
        void Info(DiagnosticCode code, const std::string& message);

        const std::vector<Diagnostic>& GetEntries() const;
        bool Has(DiagnosticCode code) const;
        size_t Count(DiagnosticCode code) const;
        bool IsEmpty() const;
        void Clear();

    private:
        std::vector<Diagnostic> entries_;
        Callback callback_;
    };

    const char* ToString(DiagnosticCode code);

} // namespace Orthoplan::Engine

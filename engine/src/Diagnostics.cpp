#include "orthoplan/Diagnostics.h"
#include <algorithm>
#include <iostream>
#include <utility>

namespace Orthoplan::Engine {

DiagnosticLog::DiagnosticLog(Callback callback) : callback_(std::move(callback)) {}

void DiagnosticLog::Report(DiagnosticCode code, DiagnosticSeverity severity, const std::string& message) {
    entries_.push_back({code, severity, message});

    if (callback_) {
        callback_(entries_.back());
        return;
    }
    if (severity == DiagnosticSeverity::WARNING) {
        std::cerr << "Orthoplan Warning [" << ToString(code) << "]: " << message << std::endl;
    }
}

void DiagnosticLog::Warn(DiagnosticCode code, const std::string& message) {
    Report(code, DiagnosticSeverity::WARNING, message);
}

void DiagnosticLog::Info(DiagnosticCode code, const std::string& message) {
    Report(code, DiagnosticSeverity::INFO, message);
}

const std::vector<Diagnostic>& DiagnosticLog::GetEntries() const {
    return entries_;
}

bool DiagnosticLog::Has(DiagnosticCode code) const {
    return Count(code) > 0;
}

size_t DiagnosticLog::Count(DiagnosticCode code) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [code](const Diagnostic& d) { return d.code == code; }));
}

bool DiagnosticLog::IsEmpty() const {
    return entries_.empty();
}

void DiagnosticLog::Clear() {
    entries_.clear();
}

const char* ToString(DiagnosticCode code) {
    switch (code) {
        case DiagnosticCode::INVALID_INPUT_DROPPED:       return "invalid-input-dropped";
        case DiagnosticCode::PARALLEL_GROUP_TOO_LARGE:    return "parallel-group-too-large";
        case DiagnosticCode::COMPARISON_LIMIT_EXCEEDED:   return "comparison-limit-exceeded";
        case DiagnosticCode::DISTANCE_CALCULATION_FAILED: return "distance-calculation-failed";
        case DiagnosticCode::LOOP_SEARCH_TRUNCATED:       return "loop-search-truncated";
        default:                                          return "unknown";
    }
}

} // namespace Orthoplan::Engine

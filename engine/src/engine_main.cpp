#include "orthoplan/engine.h"

#include <fmt/core.h>

// --- Version ---
#ifndef ORTHOPLAN_VERSION_STRING
#define ORTHOPLAN_VERSION_STRING "0.1.0-dev"
#endif

#ifdef __cplusplus
extern "C" {
#endif

    ORTHOPLAN_ENGINE_API const char* get_engine_version() {
        return ORTHOPLAN_VERSION_STRING;
    }

    ORTHOPLAN_ENGINE_API void initialize_engine() {
        fmt::print("Engine: Initializing Orthoplan Engine v{}...\n", ORTHOPLAN_VERSION_STRING);
    }

#ifdef __cplusplus
} // extern "C"
#endif

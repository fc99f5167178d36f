#ifndef ORTHOPLAN_ENGINE_H
#define ORTHOPLAN_ENGINE_H

#include "orthoplan/engine_export.h"

#ifdef __cplusplus
extern "C" {
#endif

    ORTHOPLAN_ENGINE_API const char* get_engine_version();
    ORTHOPLAN_ENGINE_API void initialize_engine(); // prints the startup banner

#ifdef __cplusplus
} // extern "C"
#endif

#endif // ORTHOPLAN_ENGINE_H

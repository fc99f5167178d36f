#pragma once

#ifdef _WIN32
  #ifdef ORTHOPLAN_ENGINE_BUILD_SHARED
    #define ORTHOPLAN_ENGINE_API __declspec(dllexport)
  #else
    #define ORTHOPLAN_ENGINE_API
  #endif
#else // Linux, macOS
  #define ORTHOPLAN_ENGINE_API __attribute__((visibility("default")))
#endif

#pragma once

#ifdef _WIN32
  #ifdef STBGEOM_ENGINE_BUILD_SHARED
    #define STBGEOM_ENGINE_API __declspec(dllexport)
  #else
    #define STBGEOM_ENGINE_API __declspec(dllimport)
  #endif
#else // Linux, macOS
  #define STBGEOM_ENGINE_API __attribute__((visibility("default")))
#endif

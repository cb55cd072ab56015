#pragma once

#ifdef _WIN32
  #ifdef STBGEOM_CAD_KERNEL_BUILD_SHARED
    #define STBGEOM_CAD_API __declspec(dllexport)
  #else
    #define STBGEOM_CAD_API __declspec(dllimport)
  #endif
#else // Linux, macOS
  #define STBGEOM_CAD_API __attribute__((visibility("default")))
#endif

#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(WYNTER_EXPORTS)
    #define WRC_API __declspec(dllexport)
  #elif defined(WYNTER_SHARED)
    #define WRC_API __declspec(dllimport)
  #else
    #define WRC_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define WRC_API __attribute__((visibility("default")))
#else
  #define WRC_API
#endif

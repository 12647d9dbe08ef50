#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(QSM_EXPORTS)
    #define QSM_API __declspec(dllexport)
  #elif defined(QSM_SHARED)
    #define QSM_API __declspec(dllimport)
  #else
    #define QSM_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define QSM_API __attribute__((visibility("default")))
#else
  #define QSM_API
#endif

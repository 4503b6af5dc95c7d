#ifndef CAPGATE_API_H
#define CAPGATE_API_H

#ifdef _WIN32
    #define CAPGATE_EXPORT __declspec(dllexport)
    #define CAPGATE_IMPORT __declspec(dllimport)
#else
    #define CAPGATE_EXPORT __attribute__((visibility("default")))
    #define CAPGATE_IMPORT __attribute__((visibility("default")))
#endif // _WIN32

#ifdef CAPGATE_BUILD
    #define CAPGATE_API CAPGATE_EXPORT
#else
    #define CAPGATE_API CAPGATE_IMPORT
#endif

#if defined(_MSC_VER)
    #define CAPGATE_FORCEINLINE __forceinline
#else
    #define CAPGATE_FORCEINLINE inline __attribute__((always_inline))
#endif

#endif // CAPGATE_API_H

#ifndef FSGATE_EXPORT_HPP
#define FSGATE_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Cross-platform shared library export/import macros.
 *
 * When building fsgate as a shared library:
 * - Define FSGATE_SHARED when using the library
 * - FSGATE_BUILDING_SHARED is defined automatically during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef FSGATE_BUILDING_SHARED
        #define FSGATE_API __declspec(dllexport)
    #elif defined(FSGATE_SHARED)
        #define FSGATE_API __declspec(dllimport)
    #else
        #define FSGATE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef FSGATE_BUILDING_SHARED
        #define FSGATE_API __attribute__((visibility("default")))
    #else
        #define FSGATE_API
    #endif
#else
    #define FSGATE_API
#endif

#endif // FSGATE_EXPORT_HPP

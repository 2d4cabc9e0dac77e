#ifndef CROSSPATH_EXPORT_HPP
#define CROSSPATH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros for crosspath.
 *
 * When building crosspath as a shared library:
 * - Define CROSSPATH_SHARED when consuming the library
 * - CROSSPATH_BUILDING_SHARED is defined by the build while compiling it
 *
 * Usage in headers:
 *   CROSSPATH_API Result<std::string> to_unix_path(const std::string& path);
 *   class CROSSPATH_API CrossPath { ... };
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef CROSSPATH_BUILDING_SHARED
        #define CROSSPATH_API __declspec(dllexport)
    #elif defined(CROSSPATH_SHARED)
        #define CROSSPATH_API __declspec(dllimport)
    #else
        #define CROSSPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef CROSSPATH_BUILDING_SHARED
        #define CROSSPATH_API __attribute__((visibility("default")))
    #else
        #define CROSSPATH_API
    #endif
#else
    #define CROSSPATH_API
#endif

#endif // CROSSPATH_EXPORT_HPP

// api.h - DLL export/import macros for json_delta

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for json_delta library.
///
/// The library is static by default. Configure with
/// -DJSON_DELTA_BUILD_SHARED=ON to build it shared; the json_delta target then
/// sets the two macros below itself.
///
/// Usage:
/// - When building json_delta as a SHARED library:
///   - CMake defines JSON_DELTA_EXPORTS (private) and JSON_DELTA_SHARED (public)
///   - Functions/classes marked with JSON_DELTA_API will be exported
///
/// - When using json_delta as a SHARED library:
///   - Link against the json_delta target (CMake propagates JSON_DELTA_SHARED)
///   - Functions/classes marked with JSON_DELTA_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSON_DELTA_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSON_DELTA_SHARED
        #ifdef JSON_DELTA_EXPORTS
            #define JSON_DELTA_API __declspec(dllexport)
        #else
            #define JSON_DELTA_API __declspec(dllimport)
        #endif
    #else
        #define JSON_DELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSON_DELTA_SHARED) && defined(JSON_DELTA_EXPORTS)
        #define JSON_DELTA_API __attribute__((visibility("default")))
    #else
        #define JSON_DELTA_API
    #endif
#else
    #define JSON_DELTA_API
#endif

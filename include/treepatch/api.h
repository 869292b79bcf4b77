// api.h - DLL export/import macros for treepatch

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for treepatch library.
///
/// Usage:
/// - When building treepatch as a SHARED library:
///   - CMake automatically defines TREEPATCH_EXPORTS (private) and TREEPATCH_SHARED (public)
///   - Functions/classes marked with TREEPATCH_API will be exported
///
/// - When building/using as a STATIC library:
///   - No macros defined, TREEPATCH_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef TREEPATCH_SHARED
        #ifdef TREEPATCH_EXPORTS
            #define TREEPATCH_API __declspec(dllexport)
        #else
            #define TREEPATCH_API __declspec(dllimport)
        #endif
    #else
        #define TREEPATCH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(TREEPATCH_SHARED) && defined(TREEPATCH_EXPORTS)
        #define TREEPATCH_API __attribute__((visibility("default")))
    #else
        #define TREEPATCH_API
    #endif
#else
    #define TREEPATCH_API
#endif

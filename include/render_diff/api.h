// api.h - DLL export/import macros for render_diff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the render_diff library.
///
/// Usage:
/// - When building render_diff as a SHARED library:
///   - CMake defines RENDER_DIFF_EXPORTS (private) and RENDER_DIFF_SHARED (public)
///   - Functions/classes marked with RENDER_DIFF_API are exported
///
/// - When using render_diff as a SHARED library:
///   - Link against the render_diff target (CMake propagates RENDER_DIFF_SHARED)
///   - Functions/classes marked with RENDER_DIFF_API are imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, RENDER_DIFF_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef RENDER_DIFF_SHARED
        #ifdef RENDER_DIFF_EXPORTS
            #define RENDER_DIFF_API __declspec(dllexport)
        #else
            #define RENDER_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define RENDER_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(RENDER_DIFF_SHARED) && defined(RENDER_DIFF_EXPORTS)
        #define RENDER_DIFF_API __attribute__((visibility("default")))
    #else
        #define RENDER_DIFF_API
    #endif
#else
    #define RENDER_DIFF_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  RENDER_DIFF_EXTERN_TEMPLATE struct BasicValue<Policy>;
// Usage in source:  template struct BasicValue<Policy>;
#define RENDER_DIFF_EXTERN_TEMPLATE extern template

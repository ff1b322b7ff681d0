// api.h - DLL export/import macros for json_edit

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for json_edit library.
///
/// Usage:
/// - When building json_edit as a SHARED library:
///   - CMake automatically defines JSON_EDIT_EXPORTS (private) and JSON_EDIT_SHARED (public)
///   - Functions/classes marked with JSON_EDIT_API will be exported
///
/// - When using json_edit as a SHARED library:
///   - Link against json_edit target (CMake propagates JSON_EDIT_SHARED)
///   - Functions/classes marked with JSON_EDIT_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSON_EDIT_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef JSON_EDIT_SHARED
        #ifdef JSON_EDIT_EXPORTS
            #define JSON_EDIT_API __declspec(dllexport)
        #else
            #define JSON_EDIT_API __declspec(dllimport)
        #endif
    #else
        #define JSON_EDIT_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(JSON_EDIT_SHARED) && defined(JSON_EDIT_EXPORTS)
        #define JSON_EDIT_API __attribute__((visibility("default")))
    #else
        #define JSON_EDIT_API
    #endif
#else
    #define JSON_EDIT_API
#endif

// ============================================================
// Template Export Helpers
// ============================================================

// Usage in header:  JSON_EDIT_EXTERN_TEMPLATE struct MyTemplate<int>;
// Usage in source:  template struct MyTemplate<int>;

#define JSON_EDIT_EXTERN_TEMPLATE extern template

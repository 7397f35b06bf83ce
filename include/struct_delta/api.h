// api.h - symbol visibility macros for struct_delta

#pragma once

/// @file api.h
/// @brief Export/import decoration for the struct_delta library.
///
/// - Building struct_delta as a SHARED library: CMake defines
///   STRUCT_DELTA_EXPORTS (private) and STRUCT_DELTA_SHARED (public), and
///   everything marked STRUCT_DELTA_API is exported.
/// - Consuming the shared library: STRUCT_DELTA_SHARED is propagated by the
///   target, STRUCT_DELTA_API turns into an import.
/// - Static builds: STRUCT_DELTA_API expands to nothing.
///
/// @code
/// class STRUCT_DELTA_API TypeRegistry { ... };
/// STRUCT_DELTA_API bool deep_equal(const Value&, const Value&);
/// @endcode

#if defined(_WIN32) || defined(_WIN64)
    #ifdef STRUCT_DELTA_SHARED
        #ifdef STRUCT_DELTA_EXPORTS
            #define STRUCT_DELTA_API __declspec(dllexport)
        #else
            #define STRUCT_DELTA_API __declspec(dllimport)
        #endif
    #else
        #define STRUCT_DELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STRUCT_DELTA_SHARED) && defined(STRUCT_DELTA_EXPORTS)
        #define STRUCT_DELTA_API __attribute__((visibility("default")))
    #else
        #define STRUCT_DELTA_API
    #endif
#else
    #define STRUCT_DELTA_API
#endif


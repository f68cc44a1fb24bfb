/**
 * @file export.h
 * @brief Public symbol export/import macro for the enroll library (shared/static builds).
 *
 * @c ENROLL_API marks public classes and functions:
 * - **Static build**: expands to nothing.
 * - **Shared build (Windows)**: @c __declspec(dllexport) when building, @c dllimport when consuming.
 * - **Shared build (ELF)**: @c __attribute__((visibility("default"))) with GCC/Clang.
 *
 * @warning
 * ENROLL_BUILD_SHARED / ENROLL_USE_SHARED must be defined consistently per target, otherwise
 * consumers hit missing exports (ELF) or wrong imports (Windows).
 */

#pragma once

#if defined(ENROLL_BUILD_STATIC)
    #define ENROLL_API
#else
    #if defined(_WIN32) || defined(__CYGWIN__)
        #if defined(ENROLL_BUILD_SHARED)
            #define ENROLL_API __declspec(dllexport)
        #elif defined(ENROLL_USE_SHARED)
            #define ENROLL_API __declspec(dllimport)
        #else
            #define ENROLL_API
        #endif
    #else
        #if defined(ENROLL_BUILD_SHARED) && (defined(__GNUC__) || defined(__clang__))
            #define ENROLL_API __attribute__((visibility("default")))
        #else
            #define ENROLL_API
        #endif
    #endif
#endif

/**
 * @file common.h
 * @brief Common definitions and utility macros for shacore library
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef SHACORE_CORE_COMMON_H
#define SHACORE_CORE_COMMON_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Platform detection
// ============================================================================
#if defined(_WIN32) || defined(_WIN64)
    #define SHACORE_PLATFORM_WINDOWS 1
    #define SHACORE_PLATFORM_NAME "Windows"
#elif defined(__linux__)
    #define SHACORE_PLATFORM_LINUX 1
    #define SHACORE_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
    #define SHACORE_PLATFORM_MACOS 1
    #define SHACORE_PLATFORM_NAME "macOS"
#else
    #define SHACORE_PLATFORM_UNKNOWN 1
    #define SHACORE_PLATFORM_NAME "Unknown"
#endif

// ============================================================================
// Export/Import macros for shared library
// ============================================================================
#ifdef SHACORE_PLATFORM_WINDOWS
    #ifdef SHACORE_SHARED_LIBRARY
        #ifdef SHACORE_BUILDING
            #define SHACORE_API __declspec(dllexport)
        #else
            #define SHACORE_API __declspec(dllimport)
        #endif
    #else
        #define SHACORE_API
    #endif
#else
    #ifdef SHACORE_SHARED_LIBRARY
        #define SHACORE_API __attribute__((visibility("default")))
    #else
        #define SHACORE_API
    #endif
#endif

// ============================================================================
// Error codes
// ============================================================================
typedef enum {
    SHACORE_SUCCESS = 0,
    SHACORE_ERROR_INVALID_PARAM = -1,
    SHACORE_ERROR_BUFFER_TOO_SMALL = -2,
    SHACORE_ERROR_MEMORY_ALLOC = -3,
    SHACORE_ERROR_LENGTH_OVERFLOW = -4,   // message bit length exceeds 2^64 - 1
    SHACORE_ERROR_INTERNAL = -10
} shacore_error_t;

// Hash parameters
#define SHACORE_SHA256_DIGEST_SIZE  32
#define SHACORE_SHA256_BLOCK_SIZE   64
#define SHACORE_SHA256_ROUNDS       64

/**
 * @brief Get library version string
 */
SHACORE_API const char* shacore_version(void);

/**
 * @brief Get platform name the library was built for
 */
SHACORE_API const char* shacore_platform(void);

/**
 * @brief Get error message for error code
 * @param error Error code
 * @return Human-readable error message
 */
SHACORE_API const char* shacore_error_string(shacore_error_t error);

/**
 * @brief Constant-time memory comparison
 * @param a First buffer
 * @param b Second buffer
 * @param size Size to compare
 * @return 0 if equal, non-zero otherwise
 */
SHACORE_API int shacore_secure_compare(const void* a, const void* b, size_t size);

#ifdef __cplusplus
}
#endif

#endif // SHACORE_CORE_COMMON_H

/**
 * @file export.cpp
 * @brief Library export functions: version, error strings, memory helpers
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#include "shacore/core/common.h"
#include "shacore/version.h"

extern "C" {

const char* shacore_version(void) {
    return SHACORE_VERSION_STRING;
}

const char* shacore_platform(void) {
    return SHACORE_PLATFORM_NAME;
}

const char* shacore_error_string(shacore_error_t error) {
    switch (error) {
        case SHACORE_SUCCESS:
            return "Success";
        case SHACORE_ERROR_INVALID_PARAM:
            return "Invalid parameter";
        case SHACORE_ERROR_BUFFER_TOO_SMALL:
            return "Buffer too small";
        case SHACORE_ERROR_MEMORY_ALLOC:
            return "Memory allocation failed";
        case SHACORE_ERROR_LENGTH_OVERFLOW:
            return "Message too long";
        case SHACORE_ERROR_INTERNAL:
            return "Internal error";
        default:
            return "Unknown error";
    }
}

int shacore_secure_compare(const void* a, const void* b, size_t size) {
    const volatile unsigned char* pa = static_cast<const volatile unsigned char*>(a);
    const volatile unsigned char* pb = static_cast<const volatile unsigned char*>(b);
    unsigned char diff = 0;

    for (size_t i = 0; i < size; i++) {
        diff |= pa[i] ^ pb[i];
    }

    return diff;
}

} // extern "C"

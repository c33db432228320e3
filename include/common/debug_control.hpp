#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace binext {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - BINEXT_PROFILE: Enable/disable profiling output (table build timings)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - BINEXT_DEBUG: Enable/disable debug output (table rows, minpoly candidates)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("BINEXT_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("BINEXT_DEBUG");
    return cached;
}

} // namespace debug
} // namespace binext

// Profile printing (timing measurements)
#define BINEXT_PROFILE_COUT(expr) \
    do { \
        if (binext::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define BINEXT_DEBUG_COUT(expr) \
    do { \
        if (binext::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

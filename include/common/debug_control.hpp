#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace starkcomp {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - STARKCOMP_PROFILE: phase timings of the composition prover
 *   Set to "1" or "true" to enable, anything else (or unset) to disable
 *
 * - STARKCOMP_DEBUG: detailed diagnostics (fragment layout, measured
 *   column degrees, configuration in effect)
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("STARKCOMP_PROFILE");
    return cached;
}

inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("STARKCOMP_DEBUG");
    return cached;
}

} // namespace debug
} // namespace starkcomp

// Profile printing (timing measurements)
#define STARKCOMP_PROFILE_PRINT(...) \
    do { \
        if (starkcomp::debug::is_profile_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define STARKCOMP_DEBUG_PRINT(...) \
    do { \
        if (starkcomp::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define STARKCOMP_DEBUG_COUT(expr) \
    do { \
        if (starkcomp::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#pragma once

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace plonkish {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - PLONKISH_PROFILE: Timing of region passes, fork and merge
 *   Set to "1" or "true" to enable
 *
 * - PLONKISH_DEBUG: Placement decisions, column reuse, sub-context windows
 *   Set to "1" or "true" to enable
 */

inline bool env_flag(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

inline bool is_profile_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag("PLONKISH_PROFILE") ? 1 : 0;
    }
    return cached == 1;
}

inline bool is_debug_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag("PLONKISH_DEBUG") ? 1 : 0;
    }
    return cached == 1;
}

} // namespace debug
} // namespace plonkish

// Profile printing (timing measurements)
#define PLONKISH_PROFILE_COUT(expr) \
    do { \
        if (plonkish::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (placement and window dumps)
#define PLONKISH_DEBUG_COUT(expr) \
    do { \
        if (plonkish::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define PLONKISH_IF_PROFILE if (plonkish::debug::is_profile_enabled())

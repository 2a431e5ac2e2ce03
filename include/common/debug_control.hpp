#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace merkle_stream {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - MERKLE_STREAM_PROFILE: Enable/disable profiling output (timing measurements)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - MERKLE_STREAM_DEBUG: Enable/disable debug output (ladder captures,
 *   verifier rejections, reader progress)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("MERKLE_STREAM_PROFILE") ? 1 : 0;
    }
    return cached == 1;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static int cached = -1;
    if (cached == -1) {
        cached = env_flag_enabled("MERKLE_STREAM_DEBUG") ? 1 : 0;
    }
    return cached == 1;
}

} // namespace debug
} // namespace merkle_stream

// Profile printing (timing measurements)
#define MERKLE_STREAM_PROFILE_ENABLED() (merkle_stream::debug::is_profile_enabled())

#define MERKLE_STREAM_PROFILE_COUT(expr) \
    do { \
        if (merkle_stream::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing (detailed state dumps)
#define MERKLE_STREAM_DEBUG_ENABLED() (merkle_stream::debug::is_debug_enabled())

#define MERKLE_STREAM_DEBUG_PRINT(...) \
    do { \
        if (merkle_stream::debug::is_debug_enabled()) { \
            printf(__VA_ARGS__); \
        } \
    } while(0)

#define MERKLE_STREAM_DEBUG_COUT(expr) \
    do { \
        if (merkle_stream::debug::is_debug_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

#define MERKLE_STREAM_IF_DEBUG if (merkle_stream::debug::is_debug_enabled())

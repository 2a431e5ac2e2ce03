#pragma once

#include <stdexcept>
#include <string>

namespace merkle_stream {

/**
 * UsageError - a tree operation was called in a state that does not allow it
 * (e.g. selecting a proof range after leaves have been pushed).
 */
class UsageError : public std::logic_error {
public:
    explicit UsageError(const std::string& what) : std::logic_error(what) {}
};

} // namespace merkle_stream

// Internal invariant checks. Active unless NDEBUG is defined; a failure means
// the construction itself is broken, never that the caller passed bad input.
#ifndef NDEBUG
#define MERKLE_STREAM_SANITY_CHECK(cond, msg) \
    do { \
        if (!(cond)) { \
            throw std::logic_error(std::string("merkle_stream sanity check failed: ") + (msg)); \
        } \
    } while(0)
#else
#define MERKLE_STREAM_SANITY_CHECK(cond, msg) do { } while(0)
#endif

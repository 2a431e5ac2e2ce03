#pragma once

#include <cstddef>
#include <cstdint>

namespace merkle_stream {

/**
 * Compile-time configuration shared by the trees, the verifier and the
 * stream readers.
 */
struct MerkleConfig {
    // Domain separation prefixes (RFC 6962 style)
    static constexpr uint8_t LEAF_HASH_PREFIX = 0x00;
    static constexpr uint8_t NODE_HASH_PREFIX = 0x01;

    // Segment size used by the tool when none is given on the command line
    static constexpr size_t DEFAULT_SEGMENT_SIZE = 64;

    // 2^height leaves per cached node must fit in a uint64_t
    static constexpr uint64_t MAX_CACHED_NODE_HEIGHT = 63;

    // Initial capacity of the reader's per-height hash array.
    // Grows on demand, but 64 heights already covers 2^64 segments.
    static constexpr size_t READER_INITIAL_HEIGHTS = 64;
};

} // namespace merkle_stream

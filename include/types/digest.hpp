#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace merkle_stream {

/**
 * Bytes - raw leaf data and proof set entries.
 *
 * Digest - output of a Hasher. Its length is the hasher's digest size;
 * the empty digest is the root of a tree that has no leaves.
 */
using Bytes = std::vector<uint8_t>;
using Digest = std::vector<uint8_t>;

// Lower-case hex representation
std::string to_hex(const Bytes& bytes);

// Parse a hex string (either case).
// @throws std::invalid_argument on odd length or a non-hex character
Bytes from_hex(const std::string& hex);

// Convenience for building leaves from literals in tools and tests
inline Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

} // namespace merkle_stream

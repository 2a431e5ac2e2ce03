#pragma once

#include "hash/hasher.hpp"
#include "types/digest.hpp"
#include <initializer_list>

namespace merkle_stream {

/**
 * Domain-separated hashing used for every Merkle tree in this library.
 *
 *   leaf: H(0x00 || data)
 *   node: H(0x01 || left || right)
 *
 * The distinct prefixes keep an interior node hash from being accepted as a
 * leaf and the other way around.
 */

// H(parts[0] || parts[1] || ...), resetting the hasher first
Digest sum(Hasher& h, std::initializer_list<const Bytes*> parts);

// H(0x00 || data)
Digest leaf_sum(Hasher& h, const Bytes& data);

// H(0x01 || left || right)
Digest node_sum(Hasher& h, const Digest& left, const Digest& right);

} // namespace merkle_stream

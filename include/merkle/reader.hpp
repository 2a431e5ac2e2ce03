#pragma once

#include "hash/hasher.hpp"
#include "proof/proof.hpp"
#include "types/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>

namespace merkle_stream {

/**
 * Stream helpers. Data is split into leaves of segment_size bytes; the last
 * leaf keeps whatever is left and is never zero-padded.
 */

// Read up to len bytes, stopping early only at end of stream.
// @return number of bytes read
// @throws std::runtime_error if the stream reports an error
size_t read_full(std::istream& in, uint8_t* buf, size_t len);

/**
 * Merkle root of a stream without building a MerkleTree.
 *
 * Keeps one hash per height, like the digits of a binary counter: a new
 * leaf hash is added at height 0 and carried upward while the slot is taken.
 * The occupied slots are folded together at the end.
 *
 * @return the root, or an empty digest if the stream is empty
 * @throws std::invalid_argument if segment_size is zero
 * @throws std::runtime_error if reading the stream fails
 */
Digest reader_root(std::istream& in, Hasher& h, size_t segment_size);

/**
 * Root and single-leaf proof for the segment at `index` of a stream.
 *
 * @throws std::invalid_argument if segment_size is zero
 * @throws std::runtime_error if reading fails or the stream ends before `index`
 */
Proof build_reader_proof(std::istream& in, std::unique_ptr<Hasher> hasher,
                         size_t segment_size, uint64_t index);

} // namespace merkle_stream

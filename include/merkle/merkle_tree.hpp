#pragma once

#include "hash/hasher.hpp"
#include "merkle/subtree_stack.hpp"
#include "proof/proof.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <istream>
#include <memory>

namespace merkle_stream {

/**
 * MerkleTree - streaming Merkle tree over raw data leaves
 *
 * Each push() adds one leaf, hashed as H(0x00 || data). root() returns the
 * Merkle root of the leaves pushed so far. The tree keeps O(log n) hashes, not
 * the leaves themselves, so the leaf (set_index) or leaf range (set_slice) to
 * prove has to be chosen before the first push.
 *
 * Trees with a leaf count that is not a power of two are not padded: the
 * rightmost subtree is joined with its taller left neighbour as is.
 */
class MerkleTree {
public:
    explicit MerkleTree(std::unique_ptr<Hasher> hasher);

    // Add one leaf
    void push(const Bytes& data) { stack_.push(data); }

    // Merkle root; empty digest for a tree without leaves
    Digest root() const { return stack_.root(); }

    // Prove the leaf at index i.
    // @throws UsageError if the tree is not empty
    void set_index(uint64_t i);

    // Prove the leaves in [begin, end).
    // @throws UsageError if the tree is not empty or the range is empty
    void set_slice(uint64_t begin, uint64_t end);

    // Proof for the selected leaf or range. The proof set is empty while
    // fewer than proof_end leaves have been pushed.
    Proof prove() const { return stack_.prove(); }

    // Discard all leaves and the proof selection
    void reset() { stack_.reset(); }

    /**
     * Push the contents of a stream as leaves of segment_size bytes.
     * The last leaf is shorter if the stream length is not a multiple of
     * segment_size; it is not padded.
     *
     * @throws std::invalid_argument if segment_size is zero
     * @throws std::runtime_error if reading the stream fails
     */
    void read_all(std::istream& in, size_t segment_size);

    uint64_t num_leaves() const { return stack_.num_leaves(); }

    Hasher& hasher() const { return stack_.hasher(); }

private:
    SubtreeStack stack_;
};

} // namespace merkle_stream

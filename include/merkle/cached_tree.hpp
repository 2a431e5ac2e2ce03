#pragma once

#include "hash/hasher.hpp"
#include "merkle/subtree_stack.hpp"
#include "proof/proof.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace merkle_stream {

/**
 * CachedTree - Merkle tree built from cached subtree roots
 *
 * Every element pushed into a CachedTree is the root of a complete Merkle
 * tree of 2^cached_node_height leaves, computed earlier and stored by the
 * caller. The resulting root equals the root of an ordinary MerkleTree over
 * all the underlying leaves, so a large dataset can be re-rooted after a
 * partial update by rehashing only the cached nodes that changed.
 *
 * Indices passed to set_index/set_slice and returned in proofs are leaf
 * indices of the full tree, not indices of cached nodes.
 */
class CachedTree {
public:
    // @throws std::invalid_argument if cached_node_height exceeds 63
    CachedTree(std::unique_ptr<Hasher> hasher, uint64_t cached_node_height);

    // Add the root of the next cached node
    // @throws std::overflow_error if the full tree would exceed 2^64 leaves
    void push(const Digest& cached_root);

    // Merkle root of the full tree; empty digest if nothing was pushed
    Digest root() const { return stack_.root(); }

    // Prove leaf i of the full tree.
    // @throws UsageError if the tree is not empty
    void set_index(uint64_t i);

    // Prove leaves [begin, end) of the full tree. A range spanning more than
    // one cached node must start and end on cached node boundaries.
    // @throws UsageError if the tree is not empty, the range is empty, or a
    //         multi-node range only partially covers a cached node
    void set_slice(uint64_t begin, uint64_t end);

    /**
     * Proof for the selected range in the full tree.
     *
     * cached_proof_set must prove the same range inside its cached node: the
     * proof_set of an ordinary MerkleTree over that node's leaves, with the
     * range made relative to the node. For a range covering whole cached
     * nodes it is simply the leaves of those nodes, in order.
     *
     * The proof set is empty if the tree does not cover the range yet.
     */
    Proof prove(const std::vector<Bytes>& cached_proof_set) const;

    /**
     * Proof whose leading entries are the cached node roots themselves.
     * Only available when the selected range covers whole cached nodes;
     * the proof set is empty otherwise. Verify with
     * verify_proof_of_cached_elements.
     */
    Proof prove_cached() const;

    // Discard all cached nodes and the proof selection
    void reset();

    uint64_t cached_node_height() const { return cached_node_height_; }
    uint64_t leaves_per_cached_node() const { return uint64_t(1) << cached_node_height_; }

    // Leaves of the full tree (cached nodes pushed * 2^height)
    uint64_t num_leaves() const { return stack_.num_leaves() << cached_node_height_; }

    // Cached nodes pushed so far
    uint64_t num_cached_nodes() const { return stack_.num_leaves(); }

private:
    SubtreeStack stack_;
    uint64_t cached_node_height_;

    // Selected range in leaves of the full tree
    uint64_t true_proof_begin_ = 0;
    uint64_t true_proof_end_ = 1;

    // The same range in cached nodes, as handed to the stack
    uint64_t cached_begin_ = 0;
    uint64_t cached_end_ = 1;
};

} // namespace merkle_stream

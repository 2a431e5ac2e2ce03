#pragma once

#include "hash/hasher.hpp"
#include "merkle/proof_ladder.hpp"
#include "proof/proof.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace merkle_stream {

/**
 * Subtree - root hash of a complete subtree of 2^height leaves covering the
 * leaf range [begin, end).
 */
struct Subtree {
    size_t height = 0;
    uint64_t begin = 0;
    uint64_t end = 0;
    Digest sum;

    // Does this subtree share at least one leaf with [proof_begin, proof_end)?
    bool overlaps(uint64_t proof_begin, uint64_t proof_end) const {
        return (begin <= proof_begin && proof_begin < end) ||
               (proof_begin <= begin && begin < proof_end);
    }
};

/**
 * SubtreeStack - incremental Merkle tree construction in O(log n) memory.
 *
 * The tree is kept as a stack of complete subtrees of strictly decreasing
 * height: a tree of 11 leaves is a subtree of height 3, one of height 1 and
 * one of height 0. A pushed leaf becomes a subtree of height 0; while the two
 * topmost subtrees have the same height they are joined into one subtree of
 * height + 1. Adding a leaf behaves like incrementing a binary counter.
 *
 * While subtrees are joined, the stack also records the sibling hashes needed
 * to prove the leaf range selected with set_slice(). That range must be chosen
 * before the first push.
 *
 * The leaf transform decides how pushed data becomes a height-0 subtree:
 * hash_leaf for ordinary trees, identity_leaf when the pushed data already is
 * the root of a cached subtree.
 */
class SubtreeStack {
public:
    using LeafTransform = std::function<Digest(Hasher&, const Bytes&)>;

    // leaf_sum(data)
    static Digest hash_leaf(Hasher& h, const Bytes& data);

    // data, unchanged
    static Digest identity_leaf(Hasher& h, const Bytes& data);

    SubtreeStack(std::unique_ptr<Hasher> hasher, LeafTransform leaf_transform);

    // Add one leaf to the tree
    void push(const Bytes& data);

    // Merkle root of everything pushed so far; empty digest if nothing was pushed
    Digest root() const;

    // Select the leaf range [begin, end) to prove.
    // @throws UsageError if a leaf was already pushed or the range is empty
    void set_slice(uint64_t begin, uint64_t end);

    // Build the proof for the selected range. The proof set is empty if the
    // tree does not cover the range yet. Does not modify the stack.
    Proof prove() const;

    // Back to the freshly constructed state, proof range [0, 1)
    void reset();

    bool empty() const { return stack_.empty(); }
    uint64_t num_leaves() const { return current_index_; }
    uint64_t proof_begin() const { return proof_begin_; }
    uint64_t proof_end() const { return proof_end_; }

    // Tallest subtree first; back() is the most recently formed subtree
    const std::vector<Subtree>& subtrees() const { return stack_; }

    const ProofLadder& ladder() const { return ladder_; }

    Hasher& hasher() const { return *hasher_; }

private:
    // Join `left` with the subtree that follows it in leaf order
    Subtree join(const Subtree& left, const Subtree& right) const;

    // If exactly one of the two subtrees about to be joined overlaps the proof
    // range, record the other one's hash at `height`
    void capture_sibling(ProofLadder& ladder, size_t height,
                         const Subtree& left, const Subtree& right) const;

    void check_stack_order() const;

    std::unique_ptr<Hasher> hasher_;
    LeafTransform leaf_transform_;

    std::vector<Subtree> stack_;
    uint64_t current_index_ = 0;

    uint64_t proof_begin_ = 0;
    uint64_t proof_end_ = 1;
    std::vector<Bytes> bases_;
    ProofLadder ladder_;
};

} // namespace merkle_stream

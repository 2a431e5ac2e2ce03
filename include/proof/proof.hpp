#pragma once

#include "types/digest.hpp"
#include <cstdint>
#include <vector>

namespace merkle_stream {

/**
 * Proof - result of proving that a leaf range belongs to a Merkle tree.
 *
 * proof_set layout:
 *   1. the raw data of every leaf in [proof_begin, proof_end), in leaf order
 *   2. sibling hashes, by increasing height; two hashes of the same height
 *      appear in leaf order
 *
 * A proof requested before the tree covers proof_end has an empty proof_set;
 * merkle_root and num_leaves still describe the tree at that moment.
 */
struct Proof {
    Digest merkle_root;
    std::vector<Bytes> proof_set;
    uint64_t proof_begin = 0;
    uint64_t proof_end = 0;
    uint64_t num_leaves = 0;

    // True if the tree had covered the selected range when the proof was built
    bool ready() const { return !proof_set.empty(); }

    bool operator==(const Proof& rhs) const {
        return merkle_root == rhs.merkle_root &&
               proof_set == rhs.proof_set &&
               proof_begin == rhs.proof_begin &&
               proof_end == rhs.proof_end &&
               num_leaves == rhs.num_leaves;
    }
    bool operator!=(const Proof& rhs) const { return !(*this == rhs); }
};

} // namespace merkle_stream

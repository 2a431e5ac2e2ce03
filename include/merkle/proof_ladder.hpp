#pragma once

#include "types/digest.hpp"
#include <cstddef>
#include <vector>

namespace merkle_stream {

/**
 * ProofLadder - sibling hashes captured while a tree is being built.
 *
 * Entry `h` holds the hashes of subtrees of height `h` that a proof for the
 * selected leaf range needs, in the order they were captured. At most two
 * hashes can exist per height: one captured while pushing, one while
 * collapsing the stack for the final root.
 *
 * The ladder is a value type; Prove works on a copy so the tree itself is
 * left untouched.
 */
class ProofLadder {
public:
    static constexpr size_t MAX_ENTRIES_PER_HEIGHT = 2;

    // Record `hash` as a proof element at `height`
    void add(size_t height, const Digest& hash);

    // Flatten into the tail of a proof set: increasing height, capture
    // order within a height.
    // @throws std::logic_error if a height holds more than two hashes
    std::vector<Bytes> fold() const;

    // Hashes recorded at `height` (empty if none)
    const std::vector<Digest>& at(size_t height) const;

    // Number of heights with storage allocated (highest height + 1)
    size_t num_heights() const { return steps_.size(); }

    // Total number of hashes recorded
    size_t size() const;

    bool empty() const { return size() == 0; }

    void clear() { steps_.clear(); }

private:
    std::vector<std::vector<Digest>> steps_;
};

} // namespace merkle_stream

#include "merkle/verify.hpp"
#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "hash/hash_ops.hpp"
#include <deque>
#include <functional>

namespace merkle_stream {
namespace {

using BaseTransform = std::function<Digest(Hasher&, const Bytes&)>;

// Shared by raw-leaf and cached-element verification; base_transform turns
// the leading proof entries into hashes on the lowest level
bool verify_range(Hasher& h, const Digest& merkle_root,
                  const std::vector<Bytes>& proof_set,
                  uint64_t proof_begin, uint64_t proof_end, uint64_t num_leaves,
                  const BaseTransform& base_transform) {
    if (merkle_root.empty()) {
        MERKLE_STREAM_DEBUG_COUT("verify: empty merkle root\n");
        return false;
    }
    if (proof_begin >= proof_end) {
        MERKLE_STREAM_DEBUG_COUT("verify: empty range [" << proof_begin << ", " << proof_end << ")\n");
        return false;
    }
    if (proof_end > num_leaves) {
        MERKLE_STREAM_DEBUG_COUT("verify: range end " << proof_end << " beyond " << num_leaves << " leaves\n");
        return false;
    }

    size_t next = 0;  // next unconsumed proof_set entry

    // Hashes of the claimed range on the current level
    std::deque<Digest> sums;
    for (uint64_t i = proof_begin; i < proof_end; ++i) {
        if (next == proof_set.size()) {
            MERKLE_STREAM_DEBUG_COUT("verify: proof set ends inside the leaf range\n");
            return false;
        }
        sums.push_back(base_transform(h, proof_set[next++]));
    }

    // One iteration per level. proof_begin, proof_end and num_leaves keep
    // their meaning, counted in subtrees of the current level.
    while (num_leaves > 1) {
        if (proof_begin % 2 == 1) {
            // Left edge is a right child: its sibling comes from the proof
            if (next == proof_set.size()) {
                MERKLE_STREAM_DEBUG_COUT("verify: missing left sibling\n");
                return false;
            }
            sums.push_front(proof_set[next++]);
            proof_begin -= 1;
        }
        if (sums.size() % 2 == 1 && proof_end < num_leaves) {
            // Right edge is a left child with a real sibling
            if (next == proof_set.size()) {
                MERKLE_STREAM_DEBUG_COUT("verify: missing right sibling\n");
                return false;
            }
            sums.push_back(proof_set[next++]);
            proof_end += 1;
        }

        std::deque<Digest> parents;
        while (sums.size() >= 2) {
            Digest left = std::move(sums.front());
            sums.pop_front();
            Digest right = std::move(sums.front());
            sums.pop_front();
            parents.push_back(node_sum(h, left, right));
        }
        if (sums.size() == 1) {
            // Orphan, promoted unchanged
            parents.push_back(std::move(sums.front()));
        }
        sums = std::move(parents);

        // proof_end and num_leaves are exclusive bounds, so round up
        proof_begin /= 2;
        proof_end = proof_end / 2 + proof_end % 2;
        num_leaves = num_leaves / 2 + num_leaves % 2;
    }

    if (next != proof_set.size()) {
        MERKLE_STREAM_DEBUG_COUT("verify: " << (proof_set.size() - next) << " unused proof entries\n");
        return false;
    }

    if (sums.front() != merkle_root) {
        MERKLE_STREAM_DEBUG_COUT("verify: root mismatch\n");
        return false;
    }
    return true;
}

} // namespace

bool verify_proof(Hasher& h, const Digest& merkle_root,
                  const std::vector<Bytes>& proof_set,
                  uint64_t proof_index, uint64_t num_leaves) {
    if (proof_index == UINT64_MAX) {
        return false;
    }
    return verify_proof_of_slice(h, merkle_root, proof_set, proof_index, proof_index + 1, num_leaves);
}

bool verify_proof_of_slice(Hasher& h, const Digest& merkle_root,
                           const std::vector<Bytes>& proof_set,
                           uint64_t proof_begin, uint64_t proof_end,
                           uint64_t num_leaves) {
    return verify_range(h, merkle_root, proof_set, proof_begin, proof_end, num_leaves,
                        [](Hasher& hasher, const Bytes& data) { return leaf_sum(hasher, data); });
}

bool verify_proof_of_slice(Hasher& h, const Proof& proof) {
    return verify_proof_of_slice(h, proof.merkle_root, proof.proof_set,
                                 proof.proof_begin, proof.proof_end, proof.num_leaves);
}

bool verify_proof_of_cached_elements(Hasher& h, const Digest& merkle_root,
                                     const std::vector<Bytes>& proof_set,
                                     uint64_t cached_node_height,
                                     uint64_t proof_begin, uint64_t proof_end,
                                     uint64_t num_leaves) {
    if (cached_node_height > MerkleConfig::MAX_CACHED_NODE_HEIGHT) {
        return false;
    }
    const uint64_t mask = (uint64_t(1) << cached_node_height) - 1;
    if ((proof_begin & mask) != 0 || (proof_end & mask) != 0 || (num_leaves & mask) != 0) {
        MERKLE_STREAM_DEBUG_COUT("verify: range is not aligned to cached nodes of height "
                                 << cached_node_height << "\n");
        return false;
    }
    return verify_range(h, merkle_root, proof_set,
                        proof_begin >> cached_node_height,
                        proof_end >> cached_node_height,
                        num_leaves >> cached_node_height,
                        [](Hasher&, const Bytes& cached_root) { return cached_root; });
}

bool verify_proof_of_cached_elements(Hasher& h, const Proof& proof,
                                     uint64_t cached_node_height) {
    return verify_proof_of_cached_elements(h, proof.merkle_root, proof.proof_set, cached_node_height,
                                           proof.proof_begin, proof.proof_end, proof.num_leaves);
}

} // namespace merkle_stream

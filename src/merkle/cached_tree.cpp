#include "merkle/cached_tree.hpp"
#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace merkle_stream {

CachedTree::CachedTree(std::unique_ptr<Hasher> hasher, uint64_t cached_node_height)
    : stack_(std::move(hasher), &SubtreeStack::identity_leaf),
      cached_node_height_(cached_node_height) {
    if (cached_node_height > MerkleConfig::MAX_CACHED_NODE_HEIGHT) {
        throw std::invalid_argument("cached node height " + std::to_string(cached_node_height) +
                                    " exceeds " + std::to_string(MerkleConfig::MAX_CACHED_NODE_HEIGHT));
    }
}

void CachedTree::push(const Digest& cached_root) {
    // num_leaves() = cached nodes << height must stay representable
    const uint64_t max_nodes = UINT64_MAX >> cached_node_height_;
    if (stack_.num_leaves() >= max_nodes) {
        throw std::overflow_error("cached tree of height " + std::to_string(cached_node_height_) +
                                  " cannot hold more than " + std::to_string(max_nodes) + " cached nodes");
    }
    stack_.push(cached_root);
}

void CachedTree::set_index(uint64_t i) {
    set_slice(i, i + 1);
}

void CachedTree::set_slice(uint64_t begin, uint64_t end) {
    if (!stack_.empty()) {
        throw UsageError("cannot call SetIndex or SetSlice on Tree if Tree has not been reset");
    }
    if (begin >= end) {
        throw UsageError("proof range [" + std::to_string(begin) + ", " + std::to_string(end) + ") is empty");
    }

    const uint64_t per_node = leaves_per_cached_node();
    uint64_t cached_begin = begin / per_node;
    uint64_t cached_end = (end - 1) / per_node + 1;
    if (cached_end != cached_begin + 1) {
        if (begin % per_node != 0 || end % per_node != 0) {
            throw UsageError("cannot call SetSlice affecting multiple cached elements "
                             "and not covering entire cached elements");
        }
    }

    stack_.set_slice(cached_begin, cached_end);
    true_proof_begin_ = begin;
    true_proof_end_ = end;
    cached_begin_ = cached_begin;
    cached_end_ = cached_end;
}

Proof CachedTree::prove(const std::vector<Bytes>& cached_proof_set) const {
    Proof tail = stack_.prove();

    Proof proof;
    proof.merkle_root = std::move(tail.merkle_root);
    proof.proof_begin = true_proof_begin_;
    proof.proof_end = true_proof_end_;
    proof.num_leaves = num_leaves();

    // The stack's proof opens with the cached roots of the range; the
    // caller's proof of the range inside those nodes replaces them
    const uint64_t cut = cached_end_ - cached_begin_;
    if (tail.proof_set.size() < cut) {
        MERKLE_STREAM_DEBUG_COUT("cached prove: tail has " << tail.proof_set.size()
                                 << " entries, need at least " << cut << "\n");
        return proof;
    }

    proof.proof_set = cached_proof_set;
    proof.proof_set.insert(proof.proof_set.end(),
                           tail.proof_set.begin() + static_cast<std::ptrdiff_t>(cut),
                           tail.proof_set.end());
    return proof;
}

Proof CachedTree::prove_cached() const {
    Proof proof = stack_.prove();
    proof.proof_begin = true_proof_begin_;
    proof.proof_end = true_proof_end_;
    proof.num_leaves = num_leaves();

    if (!proof.ready()) {
        return proof;
    }
    if ((true_proof_end_ - true_proof_begin_) % leaves_per_cached_node() != 0) {
        // The range covers part of a single cached node
        MERKLE_STREAM_DEBUG_COUT("cached prove: [" << true_proof_begin_ << ", " << true_proof_end_
                                 << ") does not cover whole cached nodes\n");
        proof.proof_set.clear();
    }
    return proof;
}

void CachedTree::reset() {
    stack_.reset();
    true_proof_begin_ = 0;
    true_proof_end_ = 1;
    cached_begin_ = 0;
    cached_end_ = 1;
}

} // namespace merkle_stream

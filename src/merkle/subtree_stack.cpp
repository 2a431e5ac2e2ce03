#include "merkle/subtree_stack.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/hash_ops.hpp"
#include <stdexcept>
#include <utility>

namespace merkle_stream {

Digest SubtreeStack::hash_leaf(Hasher& h, const Bytes& data) {
    return leaf_sum(h, data);
}

Digest SubtreeStack::identity_leaf(Hasher& /*h*/, const Bytes& data) {
    return data;
}

SubtreeStack::SubtreeStack(std::unique_ptr<Hasher> hasher, LeafTransform leaf_transform)
    : hasher_(std::move(hasher)), leaf_transform_(std::move(leaf_transform)) {
    if (!hasher_) {
        throw std::invalid_argument("SubtreeStack requires a hasher");
    }
    if (!leaf_transform_) {
        throw std::invalid_argument("SubtreeStack requires a leaf transform");
    }
}

Subtree SubtreeStack::join(const Subtree& left, const Subtree& right) const {
    MERKLE_STREAM_SANITY_CHECK(left.height >= right.height, "invalid subtree join - height mismatch");
    MERKLE_STREAM_SANITY_CHECK(left.end == right.begin, "invalid subtree join - subtrees are not adjacent");

    Subtree joined;
    joined.height = left.height + 1;
    joined.begin = left.begin;
    joined.end = right.end;
    joined.sum = node_sum(*hasher_, left.sum, right.sum);
    return joined;
}

void SubtreeStack::capture_sibling(ProofLadder& ladder, size_t height,
                                   const Subtree& left, const Subtree& right) const {
    bool left_in = left.overlaps(proof_begin_, proof_end_);
    bool right_in = right.overlaps(proof_begin_, proof_end_);
    if (right_in && !left_in) {
        ladder.add(height, left.sum);
        MERKLE_STREAM_DEBUG_COUT("ladder: height " << height << " <- left ["
                                 << left.begin << ", " << left.end << ")\n");
    } else if (left_in && !right_in) {
        ladder.add(height, right.sum);
        MERKLE_STREAM_DEBUG_COUT("ladder: height " << height << " <- right ["
                                 << right.begin << ", " << right.end << ")\n");
    }
}

void SubtreeStack::push(const Bytes& data) {
    // The leaves inside the proof range open the proof set
    if (proof_begin_ <= current_index_ && current_index_ < proof_end_) {
        bases_.push_back(data);
    }

    Subtree leaf;
    leaf.height = 0;
    leaf.begin = current_index_;
    leaf.end = current_index_ + 1;
    leaf.sum = leaf_transform_(*hasher_, data);
    stack_.push_back(std::move(leaf));

    // Join equal heights, recording a sibling hash whenever exactly one side
    // of the join overlaps the proof range
    while (stack_.size() >= 2 && stack_[stack_.size() - 1].height == stack_[stack_.size() - 2].height) {
        Subtree right = std::move(stack_.back());
        stack_.pop_back();
        Subtree left = std::move(stack_.back());
        stack_.pop_back();

        capture_sibling(ladder_, right.height, left, right);
        stack_.push_back(join(left, right));
    }
    ++current_index_;

#ifndef NDEBUG
    check_stack_order();
#endif
}

void SubtreeStack::check_stack_order() const {
    for (size_t i = 1; i < stack_.size(); ++i) {
        MERKLE_STREAM_SANITY_CHECK(stack_[i - 1].height > stack_[i].height, "subtrees are out of order");
    }
}

Digest SubtreeStack::root() const {
    if (stack_.empty()) {
        return Digest();
    }

    // Fold from the shortest subtree up; the taller subtree is always the
    // left operand
    Subtree current = stack_.back();
    for (size_t i = stack_.size() - 1; i-- > 0;) {
        current = join(stack_[i], current);
    }
    return current.sum;
}

void SubtreeStack::set_slice(uint64_t begin, uint64_t end) {
    if (!stack_.empty()) {
        throw UsageError("cannot call SetIndex or SetSlice on Tree if Tree has not been reset");
    }
    if (begin >= end) {
        throw UsageError("proof range [" + std::to_string(begin) + ", " + std::to_string(end) + ") is empty");
    }
    proof_begin_ = begin;
    proof_end_ = end;
    bases_.clear();
    ladder_.clear();
}

Proof SubtreeStack::prove() const {
    Proof proof;
    proof.proof_begin = proof_begin_;
    proof.proof_end = proof_end_;
    proof.num_leaves = current_index_;

    if (stack_.empty() || current_index_ < proof_end_) {
        MERKLE_STREAM_DEBUG_COUT("prove: range [" << proof_begin_ << ", " << proof_end_
                                 << ") not covered by " << current_index_ << " leaves\n");
        proof.merkle_root = root();
        return proof;
    }

    // Collapse the remaining subtrees like root() does. The heights no longer
    // match here; a shorter right subtree counts as the height of its left
    // sibling.
    ProofLadder ladder = ladder_;
    Subtree current = stack_.back();
    for (size_t i = stack_.size() - 1; i-- > 0;) {
        const Subtree& left = stack_[i];
        capture_sibling(ladder, left.height, left, current);
        current = join(left, current);
    }
    MERKLE_STREAM_SANITY_CHECK(current.overlaps(proof_begin_, proof_end_),
                               "could not find the subtree containing the proof slice");

    proof.merkle_root = current.sum;
    proof.proof_set = bases_;
    std::vector<Bytes> tail = ladder.fold();
    proof.proof_set.insert(proof.proof_set.end(), tail.begin(), tail.end());
    return proof;
}

void SubtreeStack::reset() {
    stack_.clear();
    current_index_ = 0;
    proof_begin_ = 0;
    proof_end_ = 1;
    bases_.clear();
    ladder_.clear();
}

} // namespace merkle_stream

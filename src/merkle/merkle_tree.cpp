#include "merkle/merkle_tree.hpp"
#include "merkle/reader.hpp"
#include <stdexcept>
#include <utility>

namespace merkle_stream {

MerkleTree::MerkleTree(std::unique_ptr<Hasher> hasher)
    : stack_(std::move(hasher), &SubtreeStack::hash_leaf) {}

void MerkleTree::set_index(uint64_t i) {
    set_slice(i, i + 1);
}

void MerkleTree::set_slice(uint64_t begin, uint64_t end) {
    stack_.set_slice(begin, end);
}

void MerkleTree::read_all(std::istream& in, size_t segment_size) {
    if (segment_size == 0) {
        throw std::invalid_argument("segment size must be nonzero");
    }

    Bytes segment(segment_size);
    while (true) {
        size_t n = read_full(in, segment.data(), segment_size);
        if (n == 0) {
            break;
        }
        if (n < segment_size) {
            // Last segment, left short
            segment.resize(n);
            push(segment);
            break;
        }
        push(segment);
    }
}

} // namespace merkle_stream

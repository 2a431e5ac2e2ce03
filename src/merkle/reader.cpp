#include "merkle/reader.hpp"
#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "hash/hash_ops.hpp"
#include "merkle/merkle_tree.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

namespace merkle_stream {

size_t read_full(std::istream& in, uint8_t* buf, size_t len) {
    in.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (in.bad()) {
        throw std::runtime_error("stream read failed");
    }
    return static_cast<size_t>(in.gcount());
}

Digest reader_root(std::istream& in, Hasher& h, size_t segment_size) {
    if (segment_size == 0) {
        throw std::invalid_argument("segment size must be nonzero");
    }

    // nodes[i] is the root of a complete subtree of height i, or empty
    std::vector<Digest> nodes(MerkleConfig::READER_INITIAL_HEIGHTS);
    Bytes buf(segment_size);
    uint64_t segments = 0;

    while (true) {
        size_t n = read_full(in, buf.data(), segment_size);
        if (n == 0) {
            break;
        }
        ++segments;

        buf.resize(n);
        Digest carry = leaf_sum(h, buf);

        // Carry into the first free height
        for (size_t i = 0;; ++i) {
            if (i == nodes.size()) {
                nodes.emplace_back();
            }
            if (nodes[i].empty()) {
                nodes[i] = std::move(carry);
                break;
            }
            carry = node_sum(h, nodes[i], carry);
            nodes[i].clear();
        }

        if (n < segment_size) {
            break;
        }
    }
    MERKLE_STREAM_DEBUG_COUT("reader_root: " << segments << " segments of " << segment_size << " bytes\n");

    // Fold the remaining subtrees, shortest first; the taller one is on the left
    Digest root;
    for (const auto& node : nodes) {
        if (node.empty()) {
            continue;
        }
        if (root.empty()) {
            root = node;
        } else {
            root = node_sum(h, node, root);
        }
    }
    return root;
}

Proof build_reader_proof(std::istream& in, std::unique_ptr<Hasher> hasher,
                         size_t segment_size, uint64_t index) {
    MerkleTree tree(std::move(hasher));
    tree.set_index(index);
    tree.read_all(in, segment_size);

    Proof proof = tree.prove();
    if (!proof.ready()) {
        throw std::runtime_error("index " + std::to_string(index) +
                                 " was not reached while creating proof");
    }
    return proof;
}

} // namespace merkle_stream

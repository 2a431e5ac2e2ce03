#include "hash/hash_ops.hpp"
#include "common/config.hpp"

namespace merkle_stream {

Digest sum(Hasher& h, std::initializer_list<const Bytes*> parts) {
    h.reset();
    for (const Bytes* part : parts) {
        h.write(*part);
    }
    return h.sum();
}

Digest leaf_sum(Hasher& h, const Bytes& data) {
    const uint8_t prefix = MerkleConfig::LEAF_HASH_PREFIX;
    h.reset();
    h.write(&prefix, 1);
    h.write(data);
    return h.sum();
}

Digest node_sum(Hasher& h, const Digest& left, const Digest& right) {
    const uint8_t prefix = MerkleConfig::NODE_HASH_PREFIX;
    h.reset();
    h.write(&prefix, 1);
    h.write(left);
    h.write(right);
    return h.sum();
}

} // namespace merkle_stream

#pragma once

#include "hash/hasher.hpp"
#include "proof/proof.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <vector>

namespace merkle_stream {

/**
 * Proof verification
 *
 * The verifier rebuilds the root from the proof set and the claimed leaf range
 * alone, replaying the tree's level-by-level joins with index arithmetic on
 * (begin, end, num_leaves). It never throws for malformed or hostile input:
 * an empty root, an empty or out-of-bounds range, a proof set that is too
 * short or too long, or a root mismatch all return false.
 */

// Verify that proof_set[0] is the leaf at proof_index of a tree with
// num_leaves leaves and root merkle_root
bool verify_proof(Hasher& h, const Digest& merkle_root,
                  const std::vector<Bytes>& proof_set,
                  uint64_t proof_index, uint64_t num_leaves);

// Verify that the first proof_end - proof_begin entries of proof_set are the
// leaves [proof_begin, proof_end). Accepts proofs from MerkleTree::prove and
// CachedTree::prove.
bool verify_proof_of_slice(Hasher& h, const Digest& merkle_root,
                           const std::vector<Bytes>& proof_set,
                           uint64_t proof_begin, uint64_t proof_end,
                           uint64_t num_leaves);

bool verify_proof_of_slice(Hasher& h, const Proof& proof);

// Verify a proof from CachedTree::prove_cached. The leading entries are
// cached-node roots, not raw leaves. Indices are in leaf units and must fall
// on cached-node boundaries.
bool verify_proof_of_cached_elements(Hasher& h, const Digest& merkle_root,
                                     const std::vector<Bytes>& proof_set,
                                     uint64_t cached_node_height,
                                     uint64_t proof_begin, uint64_t proof_end,
                                     uint64_t num_leaves);

bool verify_proof_of_cached_elements(Hasher& h, const Proof& proof,
                                     uint64_t cached_node_height);

} // namespace merkle_stream

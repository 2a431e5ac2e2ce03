#pragma once

#include "proof/proof.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace merkle_stream {

/**
 * JSON interchange for proofs.
 *
 * {
 *   "merkle_root": "<hex>",
 *   "proof_set": ["<hex>", ...],
 *   "proof_begin": 3,
 *   "proof_end": 4,
 *   "num_leaves": 15
 * }
 *
 * Optional "hash" names the hash function the proof was built with.
 */

void to_json(nlohmann::json& j, const Proof& proof);

// @throws nlohmann::json::exception on missing or mistyped fields
// @throws std::invalid_argument on malformed hex
void from_json(const nlohmann::json& j, Proof& proof);

// Read a proof from a JSON file
// @throws std::runtime_error if the file cannot be opened
Proof load_proof(const std::string& path);

// Write a proof to a JSON file, tagging it with the hash name
void save_proof(const std::string& path, const Proof& proof, const std::string& hash_name);

} // namespace merkle_stream

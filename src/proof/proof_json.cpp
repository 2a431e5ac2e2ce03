#include "proof/proof_json.hpp"
#include <fstream>
#include <stdexcept>

namespace merkle_stream {

void to_json(nlohmann::json& j, const Proof& proof) {
    nlohmann::json proof_set = nlohmann::json::array();
    for (const auto& entry : proof.proof_set) {
        proof_set.push_back(to_hex(entry));
    }
    j = nlohmann::json{
        {"merkle_root", to_hex(proof.merkle_root)},
        {"proof_set", proof_set},
        {"proof_begin", proof.proof_begin},
        {"proof_end", proof.proof_end},
        {"num_leaves", proof.num_leaves},
    };
}

void from_json(const nlohmann::json& j, Proof& proof) {
    proof.merkle_root = from_hex(j.at("merkle_root").get<std::string>());
    proof.proof_set.clear();
    for (const auto& entry : j.at("proof_set")) {
        proof.proof_set.push_back(from_hex(entry.get<std::string>()));
    }
    proof.proof_begin = j.at("proof_begin").get<uint64_t>();
    proof.proof_end = j.at("proof_end").get<uint64_t>();
    proof.num_leaves = j.at("num_leaves").get<uint64_t>();
}

Proof load_proof(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open proof file: " + path);
    }
    return nlohmann::json::parse(file).get<Proof>();
}

void save_proof(const std::string& path, const Proof& proof, const std::string& hash_name) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create proof file: " + path);
    }
    nlohmann::json j = proof;
    j["hash"] = hash_name;
    file << j.dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write proof file: " + path);
    }
}

} // namespace merkle_stream

/**
 * Merkle Tool
 *
 * Computes Merkle roots and range proofs over files split into fixed-size
 * segments, and verifies proofs written as JSON.
 *
 *   merkle_tool root <file> [segment_size]
 *   merkle_tool prove <file> <begin> <end> [segment_size]
 *   merkle_tool verify <proof.json>
 */

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "common/cli_args.hpp"
#include "common/config.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "hash/sha256.hpp"
#include "merkle/merkle_tree.hpp"
#include "merkle/reader.hpp"
#include "merkle/verify.hpp"
#include "proof/proof_json.hpp"

using namespace merkle_stream;

namespace {

constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " root <file> [segment_size]\n"
              << "  " << argv0 << " prove <file> <begin> <end> [segment_size]\n"
              << "  " << argv0 << " verify <proof.json>\n"
              << "Default segment size: " << MerkleConfig::DEFAULT_SEGMENT_SIZE << " bytes\n";
}

std::ifstream open_input(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open input file: " + path);
    }
    return in;
}

size_t parse_segment_size(int argc, char** argv, int pos) {
    if (argc <= pos) {
        return MerkleConfig::DEFAULT_SEGMENT_SIZE;
    }
    return static_cast<size_t>(parse_u64(argv[pos], "segment size"));
}

int cmd_root(const std::string& path, size_t segment_size) {
    auto start = std::chrono::steady_clock::now();
    std::ifstream in = open_input(path);
    Sha256Hasher hasher;
    Digest root = reader_root(in, hasher, segment_size);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    MERKLE_STREAM_PROFILE_COUT("[profile] root: " << elapsed << " ms\n");

    std::cout << to_hex(root) << std::endl;
    return 0;
}

int cmd_prove(const std::string& path, uint64_t begin, uint64_t end, size_t segment_size) {
    auto start = std::chrono::steady_clock::now();
    std::ifstream in = open_input(path);
    MerkleTree tree(std::make_unique<Sha256Hasher>());
    tree.set_slice(begin, end);
    tree.read_all(in, segment_size);
    Proof proof = tree.prove();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    MERKLE_STREAM_PROFILE_COUT("[profile] prove: " << elapsed << " ms, "
                               << tree.num_leaves() << " leaves\n");

    if (!proof.ready()) {
        std::cerr << "File has " << proof.num_leaves << " segments, range [" << begin << ", "
                  << end << ") is not covered" << std::endl;
        return EXIT_INVALID;
    }

    nlohmann::json j = proof;
    j["hash"] = tree.hasher().name();
    std::cout << j.dump(2) << std::endl;
    return 0;
}

int cmd_verify(const std::string& proof_path) {
    Proof proof = load_proof(proof_path);
    Sha256Hasher hasher;
    bool valid = verify_proof_of_slice(hasher, proof);
    std::cout << (valid ? "valid" : "invalid") << std::endl;
    return valid ? 0 : EXIT_INVALID;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    const std::string command = argv[1];

    try {
        if (command == "root" && argc <= 4) {
            return cmd_root(argv[2], parse_segment_size(argc, argv, 3));
        }
        if (command == "prove" && argc >= 5 && argc <= 6) {
            uint64_t begin = parse_u64(argv[3], "begin");
            uint64_t end = parse_u64(argv[4], "end");
            return cmd_prove(argv[2], begin, end, parse_segment_size(argc, argv, 5));
        }
        if (command == "verify" && argc == 3) {
            return cmd_verify(argv[2]);
        }
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_INVALID;
    }

    print_usage(argv[0]);
    return EXIT_USAGE;
}

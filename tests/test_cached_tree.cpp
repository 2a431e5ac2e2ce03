#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "hash/sha256.hpp"
#include "merkle/cached_tree.hpp"
#include "merkle/merkle_tree.hpp"
#include "merkle/verify.hpp"
#include <vector>

using namespace merkle_stream;

class CachedTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (uint8_t i = 1; i <= 8; ++i) {
            arb_data_.push_back(Bytes{i});
        }
    }

    static MerkleTree new_tree() {
        return MerkleTree(std::make_unique<Sha256Hasher>());
    }

    static CachedTree new_cached_tree(uint64_t height) {
        return CachedTree(std::make_unique<Sha256Hasher>(), height);
    }

    // Root of an ordinary tree over `leaves`
    static Digest tree_root(const std::vector<Bytes>& leaves) {
        MerkleTree tree = new_tree();
        for (const auto& l : leaves) {
            tree.push(l);
        }
        return tree.root();
    }

    // Proof of [begin, end) inside an ordinary tree over `leaves`
    static std::vector<Bytes> sub_proof(const std::vector<Bytes>& leaves, uint64_t begin, uint64_t end) {
        MerkleTree tree = new_tree();
        tree.set_slice(begin, end);
        for (const auto& l : leaves) {
            tree.push(l);
        }
        return tree.prove().proof_set;
    }

    std::vector<Bytes> arb_data_;
    Sha256Hasher hasher_;
};

TEST_F(CachedTreeTest, EmptyTreeMatchesPlainTree) {
    CachedTree cached = new_cached_tree(0);
    EXPECT_EQ(cached.root(), new_tree().root());
    EXPECT_TRUE(cached.root().empty());
}

// Blocks {1,2,3,4} and {5,6,7,8} pushed as height-2 cached roots give the
// root of the plain tree over {1..8}
TEST_F(CachedTreeTest, TwoBlocksOfHeightTwo) {
    std::vector<Bytes> first(arb_data_.begin(), arb_data_.begin() + 4);
    std::vector<Bytes> second(arb_data_.begin() + 4, arb_data_.end());

    CachedTree cached = new_cached_tree(2);
    cached.push(tree_root(first));
    cached.push(tree_root(second));

    EXPECT_EQ(cached.root(), tree_root(arb_data_));
    EXPECT_EQ(cached.num_leaves(), 8);
    EXPECT_EQ(cached.num_cached_nodes(), 2);
}

TEST_F(CachedTreeTest, HeightZeroMatchesPlainTree) {
    for (size_t n = 1; n <= arb_data_.size(); ++n) {
        std::vector<Bytes> leaves(arb_data_.begin(), arb_data_.begin() + n);
        CachedTree cached = new_cached_tree(0);
        for (const auto& l : leaves) {
            cached.push(tree_root({l}));
        }
        EXPECT_EQ(cached.root(), tree_root(leaves)) << n;
    }
}

// Five cached nodes of height 2, with an orphan at the end
TEST_F(CachedTreeTest, FiveBlocksOfHeightTwo) {
    std::vector<Bytes> block1(arb_data_.begin(), arb_data_.begin() + 4);
    std::vector<Bytes> block2(arb_data_.begin() + 4, arb_data_.end());

    CachedTree cached = new_cached_tree(2);
    for (int i = 0; i < 4; ++i) {
        cached.push(tree_root(block1));
    }
    cached.push(tree_root(block2));

    std::vector<Bytes> all;
    for (int i = 0; i < 4; ++i) {
        all.insert(all.end(), block1.begin(), block1.end());
    }
    all.insert(all.end(), block2.begin(), block2.end());
    EXPECT_EQ(cached.root(), tree_root(all));

    // A changed leaf inside one block changes the root
    std::vector<Bytes> mutated = all;
    mutated.back() = arb_data_[6];
    EXPECT_NE(cached.root(), tree_root(mutated));
}

TEST_F(CachedTreeTest, MutationIsDetected) {
    CachedTree cached = new_cached_tree(1);
    cached.push(tree_root({arb_data_[0], arb_data_[1]}));
    EXPECT_EQ(cached.root(), tree_root({arb_data_[0], arb_data_[1]}));
    EXPECT_NE(cached.root(), tree_root({arb_data_[1], arb_data_[1]}));
}

TEST_F(CachedTreeTest, ProveOnEmptyTreeIsNotReady) {
    CachedTree cached = new_cached_tree(1);
    Proof proof = cached.prove({});
    EXPECT_FALSE(proof.ready());
    EXPECT_EQ(proof.num_leaves, 0);
}

TEST_F(CachedTreeTest, ProveSingleNodeHeightZero) {
    CachedTree cached = new_cached_tree(0);
    cached.set_index(0);
    cached.push(tree_root({arb_data_[0]}));

    Proof proof = cached.prove(sub_proof({arb_data_[0]}, 0, 1));
    ASSERT_TRUE(proof.ready());
    EXPECT_TRUE(verify_proof(hasher_, tree_root({arb_data_[0]}), proof.proof_set,
                             proof.proof_begin, proof.num_leaves));

    EXPECT_THROW(cached.set_index(2), UsageError);
}

// Cache height 1, two cached nodes, leaf 1
TEST_F(CachedTreeTest, ProveInsideFirstNode) {
    std::vector<Bytes> node1 = {arb_data_[0], arb_data_[1]};
    std::vector<Bytes> node2 = {arb_data_[2], arb_data_[3]};

    CachedTree cached = new_cached_tree(1);
    cached.set_index(1);
    cached.push(tree_root(node1));
    cached.push(tree_root(node2));

    Digest root = tree_root({arb_data_[0], arb_data_[1], arb_data_[2], arb_data_[3]});
    Proof proof = cached.prove(sub_proof(node1, 1, 2));
    EXPECT_EQ(proof.merkle_root, root);
    EXPECT_EQ(proof.proof_begin, 1);
    EXPECT_EQ(proof.num_leaves, 4);
    EXPECT_TRUE(verify_proof(hasher_, root, proof.proof_set, proof.proof_begin, proof.num_leaves));

    // A proof of the wrong leaf inside the node does not verify
    Proof wrong = cached.prove(sub_proof(node1, 0, 1));
    EXPECT_FALSE(verify_proof(hasher_, root, wrong.proof_set, wrong.proof_begin, wrong.num_leaves));
}

// Cache height 0, seven cached nodes, leaf 0
TEST_F(CachedTreeTest, ProveFirstOfSevenNodes) {
    std::vector<Bytes> leaves = {arb_data_[0], arb_data_[1], arb_data_[1], arb_data_[1],
                                 arb_data_[1], arb_data_[1], arb_data_[2]};
    CachedTree cached = new_cached_tree(0);
    cached.set_index(0);
    for (const auto& l : leaves) {
        cached.push(tree_root({l}));
    }

    Proof proof = cached.prove(sub_proof({arb_data_[0]}, 0, 1));
    EXPECT_TRUE(verify_proof(hasher_, tree_root(leaves), proof.proof_set, proof.proof_begin, proof.num_leaves));
}

// Cache height 2, three cached nodes, leaf 6 (leaf 2 of node 1)
TEST_F(CachedTreeTest, ProveInsideMiddleNode) {
    std::vector<Bytes> node1 = {arb_data_[0], arb_data_[1], arb_data_[2], arb_data_[3]};
    std::vector<Bytes> node2 = {arb_data_[4], arb_data_[5], arb_data_[6], arb_data_[7]};
    std::vector<Bytes> node3 = {arb_data_[1], arb_data_[3], arb_data_[5], arb_data_[7]};

    CachedTree cached = new_cached_tree(2);
    cached.set_index(6);
    cached.push(tree_root(node1));
    cached.push(tree_root(node2));
    cached.push(tree_root(node3));

    std::vector<Bytes> all = node1;
    all.insert(all.end(), node2.begin(), node2.end());
    all.insert(all.end(), node3.begin(), node3.end());
    Digest root = tree_root(all);

    Proof proof = cached.prove(sub_proof(node2, 2, 3));
    EXPECT_EQ(proof.proof_begin, 6);
    EXPECT_EQ(proof.num_leaves, 12);
    EXPECT_TRUE(verify_proof(hasher_, root, proof.proof_set, proof.proof_begin, proof.num_leaves));

    // Same splice, but the sub-proof is for leaf 1 of the node
    Proof wrong = cached.prove(sub_proof(node2, 1, 2));
    EXPECT_FALSE(verify_proof(hasher_, root, wrong.proof_set, wrong.proof_begin, wrong.num_leaves));

    // The spliced proof is identical to a proof from the plain tree
    MerkleTree plain = new_tree();
    plain.set_index(6);
    for (const auto& l : all) {
        plain.push(l);
    }
    EXPECT_EQ(proof.proof_set, plain.prove().proof_set);
}

TEST_F(CachedTreeTest, ProveSliceAcrossWholeNodes) {
    CachedTree cached = new_cached_tree(1);
    cached.set_slice(2, 6);
    std::vector<Bytes> all(arb_data_.begin(), arb_data_.end());
    for (size_t i = 0; i < all.size(); i += 2) {
        cached.push(tree_root({all[i], all[i + 1]}));
    }

    // The proof of whole nodes inside those nodes is just their leaves
    std::vector<Bytes> leaves(all.begin() + 2, all.begin() + 6);
    Proof proof = cached.prove(leaves);
    EXPECT_EQ(proof.proof_begin, 2);
    EXPECT_EQ(proof.proof_end, 6);
    EXPECT_TRUE(verify_proof_of_slice(hasher_, tree_root(all), proof.proof_set, 2, 6, 8));
}

TEST_F(CachedTreeTest, SetSliceAlignment) {
    CachedTree cached = new_cached_tree(2);
    EXPECT_THROW(cached.set_slice(1, 6), UsageError);   // spans two nodes, unaligned
    EXPECT_THROW(cached.set_slice(4, 9), UsageError);   // spans two nodes, unaligned end
    EXPECT_THROW(cached.set_slice(3, 3), UsageError);
    EXPECT_NO_THROW(cached.set_slice(4, 12));
    EXPECT_NO_THROW(cached.set_slice(5, 7));            // inside one node
    EXPECT_NO_THROW(cached.set_slice(4, 8));            // exactly one node

    cached.push(Digest(32, 0));
    EXPECT_THROW(cached.set_slice(0, 4), UsageError);
}

TEST_F(CachedTreeTest, HeightTooLarge) {
    EXPECT_THROW(new_cached_tree(64), std::invalid_argument);
    EXPECT_NO_THROW(new_cached_tree(63));
}

// A cached node of height 63 already holds 2^63 leaves; a second one would
// push the leaf count past 2^64
TEST_F(CachedTreeTest, LeafCountOverflowRejected) {
    CachedTree cached = new_cached_tree(63);
    cached.push(tree_root({arb_data_[0]}));
    EXPECT_EQ(cached.num_leaves(), uint64_t(1) << 63);

    Digest root = cached.root();
    EXPECT_THROW(cached.push(tree_root({arb_data_[1]})), std::overflow_error);
    EXPECT_EQ(cached.num_cached_nodes(), 1);
    EXPECT_EQ(cached.num_leaves(), uint64_t(1) << 63);
    EXPECT_EQ(cached.root(), root);
    EXPECT_EQ(cached.prove_cached().num_leaves, uint64_t(1) << 63);

    // Height 62 fits three nodes
    CachedTree wide = new_cached_tree(62);
    for (int i = 0; i < 3; ++i) {
        wide.push(tree_root({arb_data_[i]}));
    }
    EXPECT_EQ(wide.num_leaves(), uint64_t(3) << 62);
    EXPECT_THROW(wide.push(tree_root({arb_data_[3]})), std::overflow_error);
}

TEST_F(CachedTreeTest, ProveNotReadyUntilRangeCovered) {
    CachedTree cached = new_cached_tree(1);
    cached.set_index(5);  // cached node 2
    cached.push(tree_root({arb_data_[0], arb_data_[1]}));
    cached.push(tree_root({arb_data_[2], arb_data_[3]}));

    Proof early = cached.prove(sub_proof({arb_data_[4], arb_data_[5]}, 1, 2));
    EXPECT_FALSE(early.ready());
    EXPECT_EQ(early.num_leaves, 4);
    EXPECT_EQ(early.proof_begin, 5);

    cached.push(tree_root({arb_data_[4], arb_data_[5]}));
    Proof ready = cached.prove(sub_proof({arb_data_[4], arb_data_[5]}, 1, 2));
    ASSERT_TRUE(ready.ready());
    EXPECT_TRUE(verify_proof(hasher_, tree_root(std::vector<Bytes>(arb_data_.begin(), arb_data_.begin() + 6)),
                             ready.proof_set, 5, 6));
}

TEST_F(CachedTreeTest, ProveCachedWholeNodes) {
    CachedTree cached = new_cached_tree(1);
    cached.set_slice(2, 6);
    std::vector<Digest> cached_roots;
    for (size_t i = 0; i < 8; i += 2) {
        cached_roots.push_back(tree_root({arb_data_[i], arb_data_[i + 1]}));
        cached.push(cached_roots.back());
    }

    Proof proof = cached.prove_cached();
    ASSERT_TRUE(proof.ready());
    EXPECT_EQ(proof.proof_set[0], cached_roots[1]);
    EXPECT_EQ(proof.proof_set[1], cached_roots[2]);
    EXPECT_EQ(proof.proof_begin, 2);
    EXPECT_EQ(proof.proof_end, 6);
    EXPECT_EQ(proof.num_leaves, 8);

    Digest root = tree_root(arb_data_);
    EXPECT_EQ(proof.merkle_root, root);
    EXPECT_TRUE(verify_proof_of_cached_elements(hasher_, proof, 1));
    EXPECT_TRUE(verify_proof_of_cached_elements(hasher_, root, proof.proof_set, 1, 2, 6, 8));

    // Wrong range or misaligned indices
    EXPECT_FALSE(verify_proof_of_cached_elements(hasher_, root, proof.proof_set, 1, 0, 4, 8));
    EXPECT_FALSE(verify_proof_of_cached_elements(hasher_, root, proof.proof_set, 1, 3, 6, 8));
    EXPECT_FALSE(verify_proof_of_cached_elements(hasher_, root, proof.proof_set, 1, 2, 6, 7));
    EXPECT_FALSE(verify_proof_of_cached_elements(hasher_, root, proof.proof_set, 2, 2, 6, 8));
}

TEST_F(CachedTreeTest, ProveCachedPartialNodeIsEmpty) {
    CachedTree cached = new_cached_tree(2);
    cached.set_index(5);
    cached.push(tree_root(std::vector<Bytes>(arb_data_.begin(), arb_data_.begin() + 4)));
    cached.push(tree_root(std::vector<Bytes>(arb_data_.begin() + 4, arb_data_.end())));

    Proof proof = cached.prove_cached();
    EXPECT_FALSE(proof.ready());
    EXPECT_EQ(proof.merkle_root, tree_root(arb_data_));
    EXPECT_EQ(proof.num_leaves, 8);
}

// Every aligned or single-node range of small cached trees proves and the
// spliced proof verifies against the plain tree
TEST_F(CachedTreeTest, SplicedProofsVerifyExhaustively) {
    for (uint64_t height = 0; height < 3; ++height) {
        const uint64_t per_node = uint64_t(1) << height;
        for (uint64_t nodes = 1; nodes <= 5; ++nodes) {
            const uint64_t n = per_node * nodes;
            std::vector<Bytes> leaves;
            for (uint64_t k = 0; k < n; ++k) {
                leaves.push_back(Bytes{static_cast<uint8_t>(k)});
            }
            std::vector<std::vector<Bytes>> blocks;
            for (uint64_t b = 0; b < nodes; ++b) {
                blocks.emplace_back(leaves.begin() + b * per_node, leaves.begin() + (b + 1) * per_node);
            }
            Digest root = tree_root(leaves);

            for (uint64_t begin = 0; begin < n; ++begin) {
                for (uint64_t end = begin + 1; end <= n; ++end) {
                    uint64_t first = begin / per_node;
                    uint64_t last = (end - 1) / per_node;
                    bool single = first == last;
                    if (!single && (begin % per_node != 0 || end % per_node != 0)) {
                        continue;
                    }

                    CachedTree cached = new_cached_tree(height);
                    cached.set_slice(begin, end);
                    for (const auto& block : blocks) {
                        cached.push(tree_root(block));
                    }

                    std::vector<Bytes> inner;
                    if (single) {
                        inner = sub_proof(blocks[first], begin - first * per_node, end - first * per_node);
                    } else {
                        inner.assign(leaves.begin() + begin, leaves.begin() + end);
                    }

                    Proof proof = cached.prove(inner);
                    EXPECT_TRUE(verify_proof_of_slice(hasher_, root, proof.proof_set, begin, end, n))
                        << "height=" << height << " nodes=" << nodes << " range=[" << begin << ", " << end << ")";
                }
            }
        }
    }
}

TEST_F(CachedTreeTest, ResetRestoresDefaults) {
    CachedTree cached = new_cached_tree(1);
    cached.set_index(3);
    cached.push(tree_root({arb_data_[0], arb_data_[1]}));
    cached.reset();

    EXPECT_TRUE(cached.root().empty());
    EXPECT_EQ(cached.num_leaves(), 0);
    EXPECT_NO_THROW(cached.set_index(2));
    EXPECT_EQ(cached.cached_node_height(), 1);
}

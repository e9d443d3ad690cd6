// FEEDROUTE - Merkle Tree Tests
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <gtest/gtest.h>
#include "feedroute/core/merkle.h"
#include "feedroute/core/types.h"
#include "feedroute/crypto/sha256.h"
#include <cstring>
#include <vector>

using namespace feedroute;

// ============================================================================
// Helper Functions
// ============================================================================

// Create a Hash256 from a simple integer (for testing)
Hash256 MakeHash(uint64_t n) {
    return SHA256Hash(reinterpret_cast<const Byte*>(&n), sizeof(n));
}

Hash256 ConcatHash(const Hash256& first, const Hash256& second) {
    std::vector<Byte> combined(64);
    std::memcpy(combined.data(), first.data(), 32);
    std::memcpy(combined.data() + 32, second.data(), 32);
    return SHA256Hash(combined);
}

// ============================================================================
// Pair Hashing
// ============================================================================

TEST(MerkleTest, PairHashIsCommutative) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    EXPECT_EQ(HashSortedPair(h1, h2), HashSortedPair(h2, h1));
}

TEST(MerkleTest, PairHashPutsSmallerFirst) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    const Hash256& lo = h1 < h2 ? h1 : h2;
    const Hash256& hi = h1 < h2 ? h2 : h1;
    EXPECT_EQ(HashSortedPair(h1, h2), ConcatHash(lo, hi));
}

// ============================================================================
// Root Computation
// ============================================================================

TEST(MerkleTest, EmptyVector) {
    std::vector<Hash256> leaves;
    Hash256 root = ComputeMerkleRoot(leaves);

    // Empty tree should return null hash
    EXPECT_TRUE(root.IsNull());
}

TEST(MerkleTest, SingleLeaf) {
    std::vector<Hash256> leaves = { MakeHash(1) };

    // Single leaf is its own root
    EXPECT_EQ(ComputeMerkleRoot(leaves), MakeHash(1));
}

TEST(MerkleTest, ThreeLeavesCarriesUnpairedNode) {
    // Tree structure:
    //         root
    //       /      |
    //    H(1,2)    3
    //    /   |
    //   1    2

    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    Hash256 h3 = MakeHash(3);

    Hash256 expected = HashSortedPair(HashSortedPair(h1, h2), h3);
    EXPECT_EQ(ComputeMerkleRoot({h1, h2, h3}), expected);
}

TEST(MerkleTest, LeafOrderWithinPairDoesNotMatter) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    EXPECT_EQ(ComputeMerkleRoot({h1, h2}), ComputeMerkleRoot({h2, h1}));
}

// ============================================================================
// Proofs
// ============================================================================

TEST(MerkleTest, EveryLeafProvesAgainstRoot) {
    for (uint32_t count = 1; count <= 9; ++count) {
        std::vector<Hash256> leaves;
        for (uint32_t i = 0; i < count; ++i) {
            leaves.push_back(MakeHash(i));
        }
        Hash256 root = ComputeMerkleRoot(leaves);

        for (uint32_t i = 0; i < count; ++i) {
            std::vector<Hash256> path = ComputeMerklePath(leaves, i);
            EXPECT_TRUE(VerifyMerkleProof(leaves[i], root, path))
                << "count " << count << " leaf " << i;
        }
    }
}

TEST(MerkleTest, PathOutOfRangeIsEmpty) {
    std::vector<Hash256> leaves = { MakeHash(1), MakeHash(2) };
    EXPECT_TRUE(ComputeMerklePath(leaves, 2).empty());
}

TEST(MerkleTest, WrongLeafFails) {
    std::vector<Hash256> leaves = { MakeHash(1), MakeHash(2), MakeHash(3), MakeHash(4) };
    Hash256 root = ComputeMerkleRoot(leaves);
    std::vector<Hash256> path = ComputeMerklePath(leaves, 0);
    EXPECT_FALSE(VerifyMerkleProof(MakeHash(5), root, path));
}

TEST(MerkleTest, EmptyProofReturnsLeaf) {
    Hash256 leaf = MakeHash(7);
    EXPECT_EQ(ProcessMerkleProof(leaf, {}), leaf);
}

// NOCKLEDGER - Merkle Tree Tests
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "nockledger/core/merkle.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/sha256.h"
#include <cstring>
#include <vector>

using namespace nockledger;

// ============================================================================
// Helper Functions
// ============================================================================

// Hash256 with `n` in its first eight bytes
static Hash256 MakeHash(uint64_t n) {
    Hash256 hash;
    std::memcpy(hash.data(), &n, sizeof(n));
    return hash;
}

static Hash256 Concat(const Hash256& a, const Hash256& b) {
    std::vector<Byte> combined(64);
    std::memcpy(combined.data(), a.data(), 32);
    std::memcpy(combined.data() + 32, b.data(), 32);
    return SHA256Hash(combined);
}

// ============================================================================
// Merkle Root
// ============================================================================

TEST(MerkleTest, EmptyListIsZeroHash) {
    EXPECT_TRUE(ComputeMerkleRoot(std::vector<Hash256>{}).IsNull());
    EXPECT_TRUE(ComputeMerkleRoot(std::vector<SignedTransaction>{}).IsNull());
}

TEST(MerkleTest, SingleLeafIsItsOwnRoot) {
    EXPECT_EQ(ComputeMerkleRoot({MakeHash(1)}), MakeHash(1));
}

TEST(MerkleTest, TwoLeavesUseSingleSha256) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    EXPECT_EQ(ComputeMerkleRoot({h1, h2}), Concat(h1, h2));
    EXPECT_EQ(HashPair(h1, h2), Concat(h1, h2));
}

TEST(MerkleTest, OddCountDuplicatesLastLeaf) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    Hash256 h3 = MakeHash(3);

    Hash256 expected = Concat(Concat(h1, h2), Concat(h3, h3));
    EXPECT_EQ(ComputeMerkleRoot({h1, h2, h3}), expected);

    // Same as the explicit four-leaf tree with the last leaf repeated
    EXPECT_EQ(ComputeMerkleRoot({h1, h2, h3}), ComputeMerkleRoot({h1, h2, h3, h3}));
}

TEST(MerkleTest, FiveLeaves) {
    std::vector<Hash256> leaves;
    for (uint64_t i = 1; i <= 5; ++i) {
        leaves.push_back(MakeHash(i));
    }
    Hash256 l12 = Concat(leaves[0], leaves[1]);
    Hash256 l34 = Concat(leaves[2], leaves[3]);
    Hash256 l55 = Concat(leaves[4], leaves[4]);
    Hash256 expected = Concat(Concat(l12, l34), Concat(l55, l55));
    EXPECT_EQ(ComputeMerkleRoot(leaves), expected);
}

TEST(MerkleTest, OrderMatters) {
    Hash256 h1 = MakeHash(1);
    Hash256 h2 = MakeHash(2);
    EXPECT_NE(ComputeMerkleRoot({h1, h2}), ComputeMerkleRoot({h2, h1}));
}

TEST(MerkleTest, TransactionLeavesAreTransactionHashes) {
    SignedTransaction a;
    a.hash = MakeHash(10).ToVector();
    SignedTransaction b;
    b.hash = MakeHash(20).ToVector();

    EXPECT_EQ(ComputeMerkleRoot(std::vector<SignedTransaction>{a, b}),
              ComputeMerkleRoot({MakeHash(10), MakeHash(20)}));
}

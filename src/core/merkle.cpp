// NOCKLEDGER - Merkle Tree Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/merkle.h"
#include "nockledger/crypto/sha256.h"

namespace nockledger {

Hash256 HashPair(const Hash256& left, const Hash256& right) {
    SHA256 hasher;
    hasher.Write(left.data(), Hash256::SIZE);
    hasher.Write(right.data(), Hash256::SIZE);
    return hasher.Finalize();
}

Hash256 ComputeMerkleRoot(std::vector<Hash256> hashes) {
    if (hashes.empty()) {
        return Hash256();
    }

    while (hashes.size() > 1) {
        if (hashes.size() & 1) {
            hashes.push_back(hashes.back());
        }
        size_t newSize = hashes.size() / 2;
        for (size_t i = 0; i < newSize; ++i) {
            hashes[i] = HashPair(hashes[i * 2], hashes[i * 2 + 1]);
        }
        hashes.resize(newSize);
    }
    return hashes[0];
}

Hash256 ComputeMerkleRoot(const std::vector<SignedTransaction>& transactions) {
    std::vector<Hash256> leaves;
    leaves.reserve(transactions.size());
    for (const auto& tx : transactions) {
        leaves.push_back(tx.GetHash());
    }
    return ComputeMerkleRoot(std::move(leaves));
}

} // namespace nockledger

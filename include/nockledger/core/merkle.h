// NOCKLEDGER - Merkle Tree Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Merkle root over an ordered list of transaction hashes.

#ifndef NOCKLEDGER_CORE_MERKLE_H
#define NOCKLEDGER_CORE_MERKLE_H

#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"

#include <vector>

namespace nockledger {

/// Compute the Merkle root of a list of leaf hashes.
///
/// @param leaves Leaf hashes in block order
/// @return The root; the null hash if leaves is empty
///
/// Levels with an odd count pair their last element with itself, so
/// [A, B, C] and [A, B, C, C] share a root.
Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves);

/// Merkle root of the transactions' hashes (each padded or truncated to
/// 32 bytes)
Hash256 ComputeMerkleRoot(const std::vector<SignedTransaction>& transactions);

/// SHA256(left || right)
Hash256 HashPair(const Hash256& left, const Hash256& right);

} // namespace nockledger

#endif // NOCKLEDGER_CORE_MERKLE_H

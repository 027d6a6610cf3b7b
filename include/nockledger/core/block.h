// NOCKLEDGER - Block Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Block primitives: the proof-of-work header and the block carrying an
// ordered list of signed transactions.

#ifndef NOCKLEDGER_CORE_BLOCK_H
#define NOCKLEDGER_CORE_BLOCK_H

#include "nockledger/consensus/params.h"
#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/transaction.h"
#include "nockledger/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {

// ============================================================================
// BlockHeader - Block metadata for hashing and proof-of-work
// ============================================================================

/// Current block version
constexpr uint32_t BLOCK_VERSION = 1;

/// Block header. The block hash is SHA-256 of the 96-byte little-endian
/// serialization below.
class BlockHeader {
public:
    uint32_t version{0};

    /// Hash of the previous block header
    Hash256 previousHash;

    /// Merkle root of the block's transactions
    Hash256 merkleRoot;

    /// Block time (Unix seconds)
    Timestamp timestamp{0};

    /// Difficulty target in compact format
    uint32_t bits{0};

    uint64_t nonce{0};

    BlockHeight height{0};

    /// Compute the header hash
    Hash256 GetHash() const;

    /// True iff the hash meets the target encoded in `bits`
    bool MeetsDifficulty() const;

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const BlockHeader& header) {
    Serialize(s, header.version);
    Serialize(s, header.previousHash);
    Serialize(s, header.merkleRoot);
    Serialize(s, header.timestamp);
    Serialize(s, header.bits);
    Serialize(s, header.nonce);
    Serialize(s, header.height);
}

template<typename Stream>
void Unserialize(Stream& s, BlockHeader& header) {
    Unserialize(s, header.version);
    Unserialize(s, header.previousHash);
    Unserialize(s, header.merkleRoot);
    Unserialize(s, header.timestamp);
    Unserialize(s, header.bits);
    Unserialize(s, header.nonce);
    Unserialize(s, header.height);
}

// ============================================================================
// Block - Header plus transactions
// ============================================================================

class Block {
public:
    BlockHeader header;
    std::vector<SignedTransaction> transactions;

    /**
     * Assemble an unmined block: version 1, timestamp now, nonce 0 and the
     * Merkle root of `transactions`.
     */
    static Block Create(const Hash256& previousHash,
                        std::vector<SignedTransaction> transactions,
                        uint32_t bits, BlockHeight height);

    /// Merkle root recomputed from the transactions
    Hash256 ComputeMerkleRoot() const;

    bool MeetsDifficulty() const { return header.MeetsDifficulty(); }

    Hash256 GetHash() const { return header.GetHash(); }

    /**
     * Validate the block.
     *
     * Checks, in order: proof of work, Merkle root, that every transaction
     * has inputs and outputs, and the serialized size limit. The first
     * failure is returned as a BlockValidation error.
     */
    Status Validate(const consensus::ChainParams& params) const;

    /// Validate against the main chain parameters
    Status Validate() const;

    /// Serialized size in bytes
    size_t GetTotalSize() const;

    std::string ToString() const;
};

template<typename Stream>
void Serialize(Stream& s, const Block& block) {
    Serialize(s, block.header);
    Serialize(s, block.transactions);
}

template<typename Stream>
void Unserialize(Stream& s, Block& block) {
    Unserialize(s, block.header);
    Unserialize(s, block.transactions);
}

} // namespace nockledger

#endif // NOCKLEDGER_CORE_BLOCK_H

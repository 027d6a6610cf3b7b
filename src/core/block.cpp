// NOCKLEDGER - Block Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/block.h"
#include "nockledger/core/merkle.h"
#include "nockledger/crypto/sha256.h"

#include <sstream>

namespace nockledger {

// ============================================================================
// BlockHeader
// ============================================================================

Hash256 BlockHeader::GetHash() const {
    SHA256 hasher;
    Serialize(hasher, *this);
    return hasher.Finalize();
}

bool BlockHeader::MeetsDifficulty() const {
    return consensus::CheckProofOfWork(GetHash(), bits);
}

std::string BlockHeader::ToString() const {
    std::ostringstream ss;
    ss << "BlockHeader(hash=" << GetHash().ToHex()
       << ", ver=" << version
       << ", prev=" << previousHash.ToHex()
       << ", merkle=" << merkleRoot.ToHex()
       << ", time=" << timestamp
       << ", bits=0x" << std::hex << bits << std::dec
       << ", nonce=" << nonce
       << ", height=" << height << ")";
    return ss.str();
}

// ============================================================================
// Block
// ============================================================================

Block Block::Create(const Hash256& previousHash,
                    std::vector<SignedTransaction> transactions,
                    uint32_t bits, BlockHeight height) {
    Block block;
    block.transactions = std::move(transactions);
    block.header.version = BLOCK_VERSION;
    block.header.previousHash = previousHash;
    block.header.merkleRoot = block.ComputeMerkleRoot();
    block.header.timestamp = GetTime();
    block.header.bits = bits;
    block.header.nonce = 0;
    block.header.height = height;
    return block;
}

Hash256 Block::ComputeMerkleRoot() const {
    return nockledger::ComputeMerkleRoot(transactions);
}

Status Block::Validate(const consensus::ChainParams& params) const {
    if (!header.MeetsDifficulty()) {
        return Status::BlockValidation("Invalid proof of work");
    }

    if (ComputeMerkleRoot() != header.merkleRoot) {
        return Status::BlockValidation("Invalid merkle root");
    }

    for (const auto& tx : transactions) {
        if (tx.inputs.empty()) {
            return Status::BlockValidation("Transaction has no inputs: " + tx.id);
        }
        if (tx.outputs.empty()) {
            return Status::BlockValidation("Transaction has no outputs: " + tx.id);
        }
    }

    size_t size = GetTotalSize();
    if (size > params.maxBlockSize) {
        return Status::BlockValidation("Block too large: " + std::to_string(size) +
                                       " bytes exceeds " +
                                       std::to_string(params.maxBlockSize));
    }
    return Status::Ok();
}

Status Block::Validate() const {
    return Validate(consensus::ChainParams::Main());
}

size_t Block::GetTotalSize() const {
    return GetSerializeSize(*this);
}

std::string Block::ToString() const {
    std::ostringstream ss;
    ss << "Block(" << header.ToString() << ", txs=" << transactions.size() << ")\n";
    for (const auto& tx : transactions) {
        ss << "  " << tx.ToString() << "\n";
    }
    return ss.str();
}

} // namespace nockledger

// NOCKLEDGER - Consensus Parameters Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Chain parameters and the proof-of-work target arithmetic shared by block
// validation and the miner.
//
// Targets are 32-byte big-endian numbers: byte 0 is the most significant
// byte, matching how block hashes are compared against them.

#ifndef NOCKLEDGER_CONSENSUS_PARAMS_H
#define NOCKLEDGER_CONSENSUS_PARAMS_H

#include "nockledger/core/types.h"

#include <cstdint>
#include <string>

namespace nockledger {
namespace consensus {

// ============================================================================
// Chain Parameters
// ============================================================================

/// Default compact difficulty (Bitcoin's genesis difficulty)
constexpr uint32_t DEFAULT_INITIAL_BITS = 0x1d00ffff;

/// Default target time between blocks in seconds
constexpr uint64_t DEFAULT_TARGET_BLOCK_TIME = 600;

/// Default number of blocks between difficulty adjustments
constexpr uint64_t DEFAULT_ADJUSTMENT_INTERVAL = 2016;

/// Default maximum serialized block size in bytes
constexpr uint64_t DEFAULT_MAX_BLOCK_SIZE = 1000000;

/// Parameters that influence chain consensus
struct ChainParams {
    /// Network name (main, regtest)
    std::string networkId{"main"};

    /// Compact difficulty for new blocks
    uint32_t initialBits{DEFAULT_INITIAL_BITS};

    /// Target time between blocks in seconds
    uint64_t targetBlockTime{DEFAULT_TARGET_BLOCK_TIME};

    /// Blocks between difficulty adjustments
    uint64_t difficultyAdjustmentInterval{DEFAULT_ADJUSTMENT_INTERVAL};

    /// Maximum serialized block size in bytes
    uint64_t maxBlockSize{DEFAULT_MAX_BLOCK_SIZE};

    /// Genesis block hash
    Hash256 genesisHash;

    /// Production defaults
    static ChainParams Main();

    /// Trivial difficulty for local testing
    static ChainParams Regtest();
};

// ============================================================================
// Difficulty Functions
// ============================================================================

/**
 * Decode compact difficulty into a 256-bit target.
 *
 * The top byte is an exponent e, the low 24 bits a mantissa m:
 * - e <= 3: m >> 8*(3-e) occupies the last three bytes
 * - 3 < e < 32: the three mantissa bytes start at byte 32-e
 * - otherwise the target is zero
 *
 * The Bitcoin sign bit (0x00800000) carries no special meaning here.
 */
Hash256 CompactToTarget(uint32_t bits);

/**
 * Encode a target in compact form.
 *
 * Inverse of CompactToTarget for targets whose first byte is zero; a zero
 * target encodes as 0.
 */
uint32_t TargetToCompact(const Hash256& target);

/// True iff hash <= target, comparing from byte 0
bool MeetsTarget(const Hash256& hash, const Hash256& target);

/// MeetsTarget against a compact difficulty
inline bool CheckProofOfWork(const Hash256& hash, uint32_t bits) {
    return MeetsTarget(hash, CompactToTarget(bits));
}

} // namespace consensus
} // namespace nockledger

#endif // NOCKLEDGER_CONSENSUS_PARAMS_H

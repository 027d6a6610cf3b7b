// NOCKLEDGER - Consensus Parameters Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/consensus/params.h"

#include <cstring>

namespace nockledger {
namespace consensus {

// ============================================================================
// Chain Parameters
// ============================================================================

ChainParams ChainParams::Main() {
    return ChainParams{};
}

ChainParams ChainParams::Regtest() {
    ChainParams params;
    params.networkId = "regtest";
    // Target 00ffffff00..00, so about one hash in 256 qualifies
    params.initialBits = 0x1fffffff;
    params.targetBlockTime = 1;
    params.difficultyAdjustmentInterval = 150;
    return params;
}

// ============================================================================
// Difficulty Functions
// ============================================================================

Hash256 CompactToTarget(uint32_t bits) {
    Hash256 target;
    uint32_t exponent = bits >> 24;
    uint32_t mantissa = bits & 0x00ffffff;

    if (exponent <= 3) {
        uint32_t word = mantissa >> (8 * (3 - exponent));
        target[29] = static_cast<Byte>((word >> 16) & 0xff);
        target[30] = static_cast<Byte>((word >> 8) & 0xff);
        target[31] = static_cast<Byte>(word & 0xff);
    } else if (exponent < 32) {
        size_t pos = 32 - exponent;
        target[pos] = static_cast<Byte>((mantissa >> 16) & 0xff);
        target[pos + 1] = static_cast<Byte>((mantissa >> 8) & 0xff);
        target[pos + 2] = static_cast<Byte>(mantissa & 0xff);
    }
    return target;
}

uint32_t TargetToCompact(const Hash256& target) {
    // First (most significant) non-zero byte
    size_t msb = 0;
    while (msb < Hash256::SIZE && target[msb] == 0) {
        ++msb;
    }
    if (msb == Hash256::SIZE) {
        return 0;
    }

    uint32_t size = static_cast<uint32_t>(Hash256::SIZE - msb);
    uint32_t word = 0;
    if (size <= 3) {
        for (size_t i = msb; i < Hash256::SIZE; ++i) {
            word = (word << 8) | target[i];
        }
        word <<= 8 * (3 - size);
    } else {
        word = (static_cast<uint32_t>(target[msb]) << 16) |
               (static_cast<uint32_t>(target[msb + 1]) << 8) |
               static_cast<uint32_t>(target[msb + 2]);
    }

    // Keep the mantissa's top bit clear so the encoding stays canonical
    if (word & 0x00800000) {
        word >>= 8;
        ++size;
    }
    return (size << 24) | word;
}

bool MeetsTarget(const Hash256& hash, const Hash256& target) {
    return std::memcmp(hash.data(), target.data(), Hash256::SIZE) <= 0;
}

} // namespace consensus
} // namespace nockledger

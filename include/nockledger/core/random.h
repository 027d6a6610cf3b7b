// NOCKLEDGER - Secure Random Number Generation Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Cryptographically secure randomness from the OS entropy source.

#ifndef NOCKLEDGER_CORE_RANDOM_H
#define NOCKLEDGER_CORE_RANDOM_H

#include "nockledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace nockledger {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the OS entropy source fails.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random 256-bit hash
Hash256 GetRandHash256();

/// Random RFC 4122 version 4 identifier, e.g.
/// "3f2b8c1e-9a4d-4c6e-b1f0-7d2e5a8c9b31"
std::string GenerateUuid();

} // namespace nockledger

#endif // NOCKLEDGER_CORE_RANDOM_H

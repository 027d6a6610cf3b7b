// NOCKLEDGER - HMAC and Key Derivation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// HMAC-SHA512, HKDF-SHA512 (RFC 5869) and PBKDF2-HMAC-SHA512, all backed by
// OpenSSL. These are the primitives behind BIP39 seeds and the wallet's
// domain-separated key derivation.

#ifndef NOCKLEDGER_CRYPTO_HMAC_H
#define NOCKLEDGER_CRYPTO_HMAC_H

#include "nockledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {

namespace hmac {
    /// HMAC-SHA512 output size
    constexpr size_t SHA512_SIZE = 64;
}

/**
 * Compute HMAC-SHA512 in one call.
 *
 * @return 64-byte MAC
 */
Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

inline Hash512 ComputeHMAC_SHA512(const std::vector<Byte>& key,
                                  const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

/**
 * HKDF with SHA512: extract-then-expand.
 *
 * @param salt Optional salt (empty means HashLen zero bytes, per RFC 5869)
 * @param ikm Input keying material
 * @param info Context info for domain separation
 * @param length Output length (at most 255 * 64)
 * @return Derived key
 *
 * Throws std::invalid_argument if length is out of range and
 * std::runtime_error if OpenSSL rejects the derivation.
 */
std::vector<Byte> HKDF_SHA512(const std::vector<Byte>& salt,
                              const std::vector<Byte>& ikm,
                              const std::vector<Byte>& info,
                              size_t length);

/**
 * PBKDF2 with HMAC-SHA512.
 *
 * Throws std::invalid_argument if iterations is zero.
 */
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen);

/// Constant-time comparison of two buffers of equal length
bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len);

/// Wipe sensitive memory in a way the optimizer cannot elide
void SecureClear(void* ptr, size_t len);

} // namespace nockledger

#endif // NOCKLEDGER_CRYPTO_HMAC_H

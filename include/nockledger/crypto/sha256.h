// NOCKLEDGER - SHA256 Hash Function
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef NOCKLEDGER_CRYPTO_SHA256_H
#define NOCKLEDGER_CRYPTO_SHA256_H

#include "nockledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Opaque OpenSSL context
struct evp_md_ctx_st;

namespace nockledger {

/// SHA-256 hasher. Also usable as a serialization stream, so transaction and
/// header fields can be written straight into a running hash.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize the hash into a 32-byte buffer. The hasher must be Reset()
    /// before it is written to again.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize and return the digest
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace nockledger

#endif // NOCKLEDGER_CRYPTO_SHA256_H

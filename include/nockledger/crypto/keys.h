// NOCKLEDGER - Signing Keys and Addresses
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Ed25519 signing identities (via OpenSSL EVP) and the 32-byte public-key
// Address with its Base58 text form.

#ifndef NOCKLEDGER_CRYPTO_KEYS_H
#define NOCKLEDGER_CRYPTO_KEYS_H

#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nockledger {

// ============================================================================
// Base58 Encoding (Bitcoin alphabet, no checksum)
// ============================================================================

/// Encode raw bytes as Base58. Leading zero bytes become leading '1's.
std::string EncodeBase58(const std::vector<uint8_t>& data);
std::string EncodeBase58(const uint8_t* data, size_t len);

/// Decode a Base58 string. Returns nullopt on any character outside the
/// alphabet.
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

// ============================================================================
// Address
// ============================================================================

/**
 * A ledger address: the 32-byte Ed25519 public key of its owner.
 *
 * Equality is byte equality. The canonical text form is Base58 and
 * Address::FromString(a.ToString()) == a for every address.
 */
class Address {
public:
    static constexpr size_t SIZE = 32;

    /// Null (all-zero) address
    Address() { bytes_.fill(0); }

    explicit Address(const std::array<Byte, SIZE>& bytes) : bytes_(bytes) {}

    /// Fails with an Address error unless exactly 32 bytes are given
    static Result<Address> FromBytes(const std::vector<Byte>& bytes);

    /// Parse Base58 text. Fails on malformed Base58 or a decoded length
    /// other than 32.
    static Result<Address> FromString(const std::string& text);

    std::string ToString() const;

    const std::array<Byte, SIZE>& bytes() const { return bytes_; }
    const Byte* data() const { return bytes_.data(); }
    constexpr size_t size() const { return SIZE; }

    bool IsNull() const;

    bool operator==(const Address& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Address& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Address& other) const { return bytes_ < other.bytes_; }

private:
    std::array<Byte, SIZE> bytes_;
};

/// Addresses serialize as their raw 32 bytes
template<typename Stream>
void Serialize(Stream& s, const Address& address) {
    s.Write(address.data(), Address::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Address& address) {
    std::array<Byte, Address::SIZE> bytes;
    s.Read(bytes.data(), bytes.size());
    address = Address(bytes);
}

// ============================================================================
// KeyPair
// ============================================================================

/**
 * An Ed25519 signing identity.
 *
 * Exclusively owns its 32-byte secret; the secret is wiped on destruction
 * and the type is move-only. Signatures are deterministic 64-byte Ed25519
 * signatures over raw message bytes.
 */
class KeyPair {
public:
    static constexpr size_t SECRET_SIZE = 32;
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;

    ~KeyPair();

    KeyPair(KeyPair&& other) noexcept;
    KeyPair& operator=(KeyPair&& other) noexcept;

    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;

    /// Fresh key from OS randomness
    static Result<KeyPair> Generate();

    /// Import a raw 32-byte secret. Fails with a Crypto error on any other
    /// length.
    static Result<KeyPair> FromSecret(const std::vector<Byte>& secret);

    /// Address (public key) derived from the secret
    const Address& GetAddress() const { return address_; }

    /// Raw public key bytes
    std::vector<Byte> GetPublicKey() const;

    /// Copy of the secret bytes (handle with care)
    std::vector<Byte> GetSecret() const;

    /// Sign a message
    Result<std::vector<Byte>> Sign(const Byte* message, size_t len) const;
    Result<std::vector<Byte>> Sign(const std::vector<Byte>& message) const {
        return Sign(message.data(), message.size());
    }

    /// Verify a signature made by this key
    bool Verify(const std::vector<Byte>& message, const std::vector<Byte>& signature) const {
        return VerifySignature(address_, message, signature);
    }

    /// Verify a signature against a bare public key
    static bool VerifySignature(const Address& publicKey,
                                const std::vector<Byte>& message,
                                const std::vector<Byte>& signature);

private:
    KeyPair() = default;

    std::array<Byte, SECRET_SIZE> secret_{};
    Address address_;
};

} // namespace nockledger

namespace std {
template<>
struct hash<nockledger::Address> {
    size_t operator()(const nockledger::Address& addr) const noexcept {
        size_t h = 0;
        std::memcpy(&h, addr.data(), sizeof(h));
        return h;
    }
};
} // namespace std

#endif // NOCKLEDGER_CRYPTO_KEYS_H

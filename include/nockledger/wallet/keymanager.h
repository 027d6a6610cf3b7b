// NOCKLEDGER - Key Manager
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Named registry of signing identities. Each entry owns one KeyPair; the
// registry hands out addresses and signatures, never the secret itself
// unless explicitly asked through GetKey().

#ifndef NOCKLEDGER_WALLET_KEYMANAGER_H
#define NOCKLEDGER_WALLET_KEYMANAGER_H

#include "nockledger/core/status.h"
#include "nockledger/core/types.h"
#include "nockledger/crypto/keys.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nockledger {
namespace wallet {

/**
 * Registry of named key pairs.
 *
 * Not internally synchronized; the owning Wallet serializes access.
 */
class KeyManager {
public:
    KeyManager() = default;

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) = default;
    KeyManager& operator=(KeyManager&&) = default;

    /// Create a fresh random key under `name`. Fails with KeyExists if the
    /// name is already registered.
    Result<Address> GenerateKey(const std::string& name);

    /// Register a key from a 32-byte secret. Fails with a Crypto error on a
    /// wrong length and with KeyExists if the name is taken.
    Result<Address> ImportKey(const std::string& name, const std::vector<Byte>& secret);

    /// Register the key derived from a BIP39 phrase
    Result<Address> ImportMnemonic(const std::string& name,
                                   const std::string& phrase,
                                   const std::string& passphrase = "");

    /// Look up a key. The pointer stays valid until the key is removed.
    Result<const KeyPair*> GetKey(const std::string& name) const;

    /// Sign raw bytes with the named key
    Result<std::vector<Byte>> SignWithKey(const std::string& name,
                                          const std::vector<Byte>& message) const;

    /// Verify a signature made by the named key
    Result<bool> VerifyWithKey(const std::string& name,
                               const std::vector<Byte>& message,
                               const std::vector<Byte>& signature) const;

    /// Remove and wipe a key
    Status RemoveKey(const std::string& name);

    bool HasKey(const std::string& name) const { return keys_.count(name) > 0; }

    /// Key names in sorted order
    std::vector<std::string> ListKeys() const;

    /// Addresses in key-name order
    std::vector<Address> GetAddresses() const;

    /// Name of the key owning `address`, if any
    std::optional<std::string> FindKeyByAddress(const Address& address) const;

    bool IsMine(const Address& address) const {
        return FindKeyByAddress(address).has_value();
    }

    size_t Size() const { return keys_.size(); }

private:
    Result<Address> Insert(const std::string& name, KeyPair&& key);

    std::map<std::string, KeyPair> keys_;
};

} // namespace wallet
} // namespace nockledger

#endif // NOCKLEDGER_WALLET_KEYMANAGER_H

// NOCKLEDGER - Key Manager Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/wallet/keymanager.h"
#include "nockledger/crypto/hmac.h"
#include "nockledger/util/logging.h"
#include "nockledger/wallet/mnemonic.h"

namespace nockledger {
namespace wallet {

Result<Address> KeyManager::Insert(const std::string& name, KeyPair&& key) {
    Address address = key.GetAddress();
    keys_.emplace(name, std::move(key));
    LOG_INFO(util::LogCategory::WALLET) << "Registered key '" << name
        << "' with address " << address.ToString();
    return address;
}

Result<Address> KeyManager::GenerateKey(const std::string& name) {
    if (HasKey(name)) {
        return Status::KeyExists(name);
    }
    auto key = KeyPair::Generate();
    if (!key) {
        return key.status();
    }
    return Insert(name, key.Take());
}

Result<Address> KeyManager::ImportKey(const std::string& name,
                                      const std::vector<Byte>& secret) {
    auto key = KeyPair::FromSecret(secret);
    if (!key) {
        return key.status();
    }
    if (HasKey(name)) {
        return Status::KeyExists(name);
    }
    return Insert(name, key.Take());
}

Result<Address> KeyManager::ImportMnemonic(const std::string& name,
                                           const std::string& phrase,
                                           const std::string& passphrase) {
    if (HasKey(name)) {
        return Status::KeyExists(name);
    }
    auto seed = Mnemonic::DeriveWalletSeed(phrase, passphrase);
    if (!seed) {
        return seed.status();
    }
    auto key = KeyPair::FromSecret(*seed);
    SecureClear(seed->data(), seed->size());
    if (!key) {
        return key.status();
    }
    return Insert(name, key.Take());
}

Result<const KeyPair*> KeyManager::GetKey(const std::string& name) const {
    auto it = keys_.find(name);
    if (it == keys_.end()) {
        return Status::KeyNotFound(name);
    }
    return &it->second;
}

Result<std::vector<Byte>> KeyManager::SignWithKey(const std::string& name,
                                                  const std::vector<Byte>& message) const {
    auto it = keys_.find(name);
    if (it == keys_.end()) {
        return Status::KeyNotFound(name);
    }
    return it->second.Sign(message);
}

Result<bool> KeyManager::VerifyWithKey(const std::string& name,
                                       const std::vector<Byte>& message,
                                       const std::vector<Byte>& signature) const {
    auto it = keys_.find(name);
    if (it == keys_.end()) {
        return Status::KeyNotFound(name);
    }
    return it->second.Verify(message, signature);
}

Status KeyManager::RemoveKey(const std::string& name) {
    if (keys_.erase(name) == 0) {
        return Status::KeyNotFound(name);
    }
    LOG_INFO(util::LogCategory::WALLET) << "Removed key '" << name << "'";
    return Status::Ok();
}

std::vector<std::string> KeyManager::ListKeys() const {
    std::vector<std::string> names;
    names.reserve(keys_.size());
    for (const auto& entry : keys_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<Address> KeyManager::GetAddresses() const {
    std::vector<Address> addresses;
    addresses.reserve(keys_.size());
    for (const auto& entry : keys_) {
        addresses.push_back(entry.second.GetAddress());
    }
    return addresses;
}

std::optional<std::string> KeyManager::FindKeyByAddress(const Address& address) const {
    for (const auto& entry : keys_) {
        if (entry.second.GetAddress() == address) {
            return entry.first;
        }
    }
    return std::nullopt;
}

} // namespace wallet
} // namespace nockledger

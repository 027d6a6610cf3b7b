// NOCKLEDGER - Signing Keys and Addresses Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/crypto/keys.h"
#include "nockledger/core/random.h"
#include "nockledger/crypto/hmac.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cstring>
#include <memory>

namespace nockledger {

namespace {

// ============================================================================
// OpenSSL RAII helpers
// ============================================================================

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int Base58Value(char c) {
    if (c == '\0') return -1;
    const char* pos = std::strchr(BASE58_ALPHABET, c);
    return pos ? static_cast<int>(pos - BASE58_ALPHABET) : -1;
}

} // namespace

// ============================================================================
// Base58
// ============================================================================

std::string EncodeBase58(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) {
        ++zeros;
    }

    // Little-endian base-58 digits of the big-endian input number
    std::vector<uint8_t> digits;
    digits.reserve((len - zeros) * 138 / 100 + 1);
    for (size_t i = zeros; i < len; ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    out.reserve(zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(BASE58_ALPHABET[*it]);
    }
    return out;
}

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    return EncodeBase58(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t ones = 0;
    while (ones < str.size() && str[ones] == '1') {
        ++ones;
    }

    std::vector<uint8_t> bytes;  // little-endian base-256
    bytes.reserve((str.size() - ones) * 733 / 1000 + 1);
    for (size_t i = ones; i < str.size(); ++i) {
        int value = Base58Value(str[i]);
        if (value < 0) {
            return std::nullopt;
        }
        uint32_t carry = static_cast<uint32_t>(value);
        for (auto& b : bytes) {
            carry += static_cast<uint32_t>(b) * 58;
            b = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    std::vector<uint8_t> out(ones, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

// ============================================================================
// Address
// ============================================================================

Result<Address> Address::FromBytes(const std::vector<Byte>& bytes) {
    if (bytes.size() != SIZE) {
        return Status::Address("Invalid address length: expected " +
                               std::to_string(SIZE) + " bytes, got " +
                               std::to_string(bytes.size()));
    }
    std::array<Byte, SIZE> raw;
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return Address(raw);
}

Result<Address> Address::FromString(const std::string& text) {
    auto decoded = DecodeBase58(text);
    if (!decoded) {
        return Status::Address("Invalid base58 address: " + text);
    }
    return FromBytes(*decoded);
}

std::string Address::ToString() const {
    return EncodeBase58(bytes_.data(), bytes_.size());
}

bool Address::IsNull() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
}

// ============================================================================
// KeyPair
// ============================================================================

KeyPair::~KeyPair() {
    SecureClear(secret_.data(), secret_.size());
}

KeyPair::KeyPair(KeyPair&& other) noexcept
    : secret_(other.secret_), address_(other.address_) {
    SecureClear(other.secret_.data(), other.secret_.size());
}

KeyPair& KeyPair::operator=(KeyPair&& other) noexcept {
    if (this != &other) {
        secret_ = other.secret_;
        address_ = other.address_;
        SecureClear(other.secret_.data(), other.secret_.size());
    }
    return *this;
}

Result<KeyPair> KeyPair::Generate() {
    std::vector<Byte> secret(SECRET_SIZE);
    try {
        GetRandBytes(secret.data(), secret.size());
    } catch (const std::runtime_error& e) {
        return Status::Crypto(e.what());
    }
    auto result = FromSecret(secret);
    SecureClear(secret.data(), secret.size());
    return result;
}

Result<KeyPair> KeyPair::FromSecret(const std::vector<Byte>& secret) {
    if (secret.size() != SECRET_SIZE) {
        return Status::Crypto("Invalid secret key length: expected 32 bytes, got " +
                              std::to_string(secret.size()));
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              secret.data(), secret.size()));
    if (!pkey) {
        return Status::Crypto("Failed to load Ed25519 secret key");
    }

    std::array<Byte, PUBLIC_KEY_SIZE> pub;
    size_t pubLen = pub.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pub.data(), &pubLen) != 1 ||
        pubLen != PUBLIC_KEY_SIZE) {
        return Status::Crypto("Failed to derive Ed25519 public key");
    }

    KeyPair kp;
    std::copy(secret.begin(), secret.end(), kp.secret_.begin());
    kp.address_ = Address(pub);
    return std::move(kp);
}

std::vector<Byte> KeyPair::GetPublicKey() const {
    return std::vector<Byte>(address_.bytes().begin(), address_.bytes().end());
}

std::vector<Byte> KeyPair::GetSecret() const {
    return std::vector<Byte>(secret_.begin(), secret_.end());
}

Result<std::vector<Byte>> KeyPair::Sign(const Byte* message, size_t len) const {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              secret_.data(), secret_.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return Status::Crypto("Failed to initialise signing context");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return Status::Crypto("Ed25519 sign init failed");
    }

    static const Byte EMPTY = 0;
    std::vector<Byte> signature(SIGNATURE_SIZE);
    size_t sigLen = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen,
                       len ? message : &EMPTY, len) != 1 ||
        sigLen != SIGNATURE_SIZE) {
        return Status::Crypto("Ed25519 signing failed");
    }
    return signature;
}

bool KeyPair::VerifySignature(const Address& publicKey,
                              const std::vector<Byte>& message,
                              const std::vector<Byte>& signature) {
    if (signature.size() != SIGNATURE_SIZE) {
        return false;
    }

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             publicKey.data(), publicKey.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx ||
        EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }

    static const Byte EMPTY = 0;
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.empty() ? &EMPTY : message.data(),
                            message.size()) == 1;
}

} // namespace nockledger

// NOCKLEDGER - HMAC and Key Derivation Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/crypto/hmac.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>

#include <memory>
#include <stdexcept>

namespace nockledger {

namespace {

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

} // namespace

// ============================================================================
// HMAC-SHA512
// ============================================================================

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash512 mac;
    unsigned int macLen = 0;
    static const Byte EMPTY = 0;
    if (!HMAC(EVP_sha512(), keyLen ? key : &EMPTY, static_cast<int>(keyLen),
              dataLen ? data : &EMPTY, dataLen, mac.data(), &macLen) ||
        macLen != hmac::SHA512_SIZE) {
        throw std::runtime_error("HMAC-SHA512 failed");
    }
    return mac;
}

// ============================================================================
// HKDF-SHA512
// ============================================================================

std::vector<Byte> HKDF_SHA512(const std::vector<Byte>& salt,
                              const std::vector<Byte>& ikm,
                              const std::vector<Byte>& info,
                              size_t length) {
    if (length == 0 || length > 255 * hmac::SHA512_SIZE) {
        throw std::invalid_argument("HKDF output length out of range");
    }

    // RFC 5869: an absent salt is HashLen zero bytes
    std::vector<Byte> actualSalt = salt;
    if (actualSalt.empty()) {
        actualSalt.assign(hmac::SHA512_SIZE, 0);
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx ||
        EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha512()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), actualSalt.data(),
                                    static_cast<int>(actualSalt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(),
                                   static_cast<int>(ikm.size())) <= 0) {
        throw std::runtime_error("HKDF-SHA512 setup failed");
    }
    if (!info.empty() &&
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(),
                                    static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("HKDF-SHA512 info rejected");
    }

    std::vector<Byte> okm(length);
    size_t outLen = length;
    if (EVP_PKEY_derive(ctx.get(), okm.data(), &outLen) <= 0 || outLen != length) {
        throw std::runtime_error("HKDF-SHA512 derive failed");
    }
    return okm;
}

// ============================================================================
// PBKDF2-HMAC-SHA512
// ============================================================================

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2 iterations must be > 0");
    }

    std::vector<Byte> dk(keyLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(keyLen), dk.data()) != 1) {
        throw std::runtime_error("PBKDF2-SHA512 failed");
    }
    return dk;
}

// ============================================================================
// Helpers
// ============================================================================

bool ConstantTimeCompare(const Byte* a, const Byte* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

void SecureClear(void* ptr, size_t len) {
    OPENSSL_cleanse(ptr, len);
}

} // namespace nockledger

// NOCKLEDGER - SHA256 Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/crypto/sha256.h"

#include <openssl/evp.h>

#include <new>
#include <stdexcept>

namespace nockledger {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::bad_alloc();
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: digest init failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("SHA256: digest update failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: digest final failed");
    }
}

Hash256 SHA256::Finalize() {
    Hash256 result;
    Finalize(result.data());
    return result;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    unsigned int outLen = 0;
    if (EVP_Digest(data, len, result.data(), &outLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA256: one-shot digest failed");
    }
    return result;
}

} // namespace nockledger

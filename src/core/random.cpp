// NOCKLEDGER - Secure Random Number Generation Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/random.h"
#include "nockledger/core/hex.h"

#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>
#else
    #include <fstream>
#endif

namespace nockledger {

namespace {

bool GetOSEntropy(uint8_t* buf, size_t len) {
    if (len == 0) return true;

#if defined(__linux__)
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret <= 0) {
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;
#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return urandom.good();
#endif
}

} // namespace

void GetRandBytes(uint8_t* buf, size_t len) {
    if (!GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

Hash256 GetRandHash256() {
    Hash256 hash;
    GetRandBytes(hash.data(), hash.size());
    return hash;
}

std::string GenerateUuid() {
    uint8_t bytes[16];
    GetRandBytes(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // variant 1

    std::string hex = BytesToHex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace nockledger

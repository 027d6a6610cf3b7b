// NOCKLEDGER - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/core/hex.h"

#include <stdexcept>

namespace nockledger {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> out(hex.length() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = NibbleValue(hex[2 * i]);
        int lo = NibbleValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (NibbleValue(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace nockledger

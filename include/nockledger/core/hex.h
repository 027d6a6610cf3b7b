// NOCKLEDGER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#ifndef NOCKLEDGER_CORE_HEX_H
#define NOCKLEDGER_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nockledger {

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace nockledger

#endif // NOCKLEDGER_CORE_HEX_H

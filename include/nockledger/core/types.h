// NOCKLEDGER - Core Types Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Fundamental value types shared by the ledger, wallet and consensus code.

#ifndef NOCKLEDGER_CORE_TYPES_H
#define NOCKLEDGER_CORE_TYPES_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace nockledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in base units. Amounts are never negative.
using Amount = uint64_t;

/// Timestamp in Unix epoch seconds (block headers)
using Timestamp = uint64_t;

/// Timestamp in Unix epoch milliseconds (wallet records)
using TimestampMillis = int64_t;

/// Block height
using BlockHeight = uint64_t;

// ============================================================================
// Time Functions
// ============================================================================

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count());
}

/// Get current time in milliseconds
inline TimestampMillis GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Amount Arithmetic
// ============================================================================

/// Add two amounts, returning false on overflow
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a > UINT64_MAX - b) {
        return false;
    }
    out = a + b;
    return true;
}

/// Subtract, clamping at zero
inline Amount SaturatingSub(Amount a, Amount b) {
    return a > b ? a - b : 0;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size byte string. Byte 0 is the most significant byte when a hash
/// is interpreted as a number (proof-of-work targets).
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes. Shorter input is zero-padded on the right,
    /// longer input is truncated.
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    std::vector<Byte> ToVector() const {
        return std::vector<Byte>(data_.begin(), data_.end());
    }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic order from byte 0
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex of the bytes in storage order
    std::string ToHex() const;

    /// Parse from hex (throws std::invalid_argument on bad input)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
};

/// 512-bit hash (64 bytes)
class Hash512 : public BaseHash<512> {
public:
    using BaseHash<512>::BaseHash;
    Hash512() = default;
    Hash512(const BaseHash<512>& base) : BaseHash<512>(base) {}
};

} // namespace nockledger

#endif // NOCKLEDGER_CORE_TYPES_H

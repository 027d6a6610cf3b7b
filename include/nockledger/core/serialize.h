// NOCKLEDGER - Serialization Header
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Little-endian binary serialization used for broadcast bytes, persisted
// wallet records and the hashed byte sequences of transactions and headers.
// Any type with Write(const uint8_t*, size_t) is a valid output stream, so the
// same Serialize() overloads feed a DataStream or a running SHA256.

#ifndef NOCKLEDGER_CORE_SERIALIZE_H
#define NOCKLEDGER_CORE_SERIALIZE_H

#include "nockledger/core/types.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <optional>
#include <string>
#include <vector>

namespace nockledger {

/// Maximum size for a length prefix read from untrusted input (32 MB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

/// Cap on up-front vector reservation while decoding
static constexpr size_t MAX_VECTOR_ALLOCATE = 5000000;

// ============================================================================
// Endianness Helpers
// ============================================================================

namespace detail {

inline uint16_t htole16(uint16_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap16(host);
#else
    return host;
#endif
}

inline uint32_t htole32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t htole64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

} // namespace detail

// ============================================================================
// DataStream - In-memory byte buffer
// ============================================================================

class DataStream {
public:
    DataStream() = default;
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - readPos_; }
    bool empty() const noexcept { return size() == 0; }

    /// Whole buffer, including bytes already read
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    /// Throws std::ios_base::failure when fewer than len bytes remain
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + readPos_, len);
        }
        readPos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    void Rewind() { readPos_ = 0; }

    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_{0};
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj) {
    obj = detail::htole16(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 2);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    obj = detail::htole32(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    obj = detail::htole64(obj);
    s.Write(reinterpret_cast<const uint8_t*>(&obj), 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint16_t ser_readdata16(Stream& s) {
    uint16_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 2);
    return detail::htole16(obj);
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint32_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 4);
    return detail::htole32(obj);
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint64_t obj;
    s.Read(reinterpret_cast<uint8_t*>(&obj), 8);
    return detail::htole64(obj);
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFF     -- 0xFD + 2 bytes
//   size <= 0xFFFFFFFF -- 0xFE + 4 bytes
//   otherwise          -- 0xFF + 8 bytes

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        ser_writedata8(s, 0xFD);
        ser_writedata16(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 253) {
        size = ser_readdata16(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 0x10000) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        size = ser_readdata64(s);
        if (size < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }
template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }
template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Strings and Byte Vectors (length-prefixed)
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(reinterpret_cast<uint8_t*>(&str[0]), size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

// ============================================================================
// Fixed-Size Hashes (raw, no prefix)
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

// ============================================================================
// Containers
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min<uint64_t>(size, MAX_VECTOR_ALLOCATE / sizeof(T)));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

/// Optional values are a presence byte followed by the value
template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    ser_writedata8(s, opt.has_value() ? 1 : 0);
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    uint8_t present = ser_readdata8(s);
    if (present > 1) {
        throw std::ios_base::failure("Unserialize(optional): bad presence flag");
    }
    if (present) {
        T value;
        Unserialize(s, value);
        opt = std::move(value);
    } else {
        opt.reset();
    }
}

// ============================================================================
// GetSerializeSize
// ============================================================================

/// Stream that only counts bytes
class SizeComputer {
public:
    void Write(const uint8_t*, size_t len) { size_ += len; }
    size_t size() const noexcept { return size_; }

private:
    size_t size_{0};
};

template<typename T>
size_t GetSerializeSize(const T& obj) {
    SizeComputer sc;
    Serialize(sc, obj);
    return sc.size();
}

// ============================================================================
// DataStream Stream Operators
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace nockledger

#endif // NOCKLEDGER_CORE_SERIALIZE_H

// NOCKLEDGER - Storage Abstraction Layer
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// Key-value persistence for wallet records. Records are opaque byte blobs;
// SaveRecord/LoadRecord serialize typed values through DataStream.

#ifndef NOCKLEDGER_STORAGE_STORAGE_H
#define NOCKLEDGER_STORAGE_STORAGE_H

#include "nockledger/core/serialize.h"
#include "nockledger/core/status.h"
#include "nockledger/core/types.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace nockledger {
namespace storage {

// ============================================================================
// Storage Interface
// ============================================================================

/**
 * Persistence collaborator.
 *
 * Implementations report failures as Storage errors; Load of a missing key
 * is a Storage error as well.
 */
class Storage {
public:
    virtual ~Storage() = default;

    virtual Status Save(const std::string& key, const std::vector<Byte>& record) = 0;

    virtual Result<std::vector<Byte>> Load(const std::string& key) = 0;

    virtual bool Exists(const std::string& key) = 0;

    virtual Status Delete(const std::string& key) = 0;
};

// ============================================================================
// Memory Storage
// ============================================================================

/// Thread-safe in-memory Storage
class MemoryStorage : public Storage {
public:
    MemoryStorage() = default;

    Status Save(const std::string& key, const std::vector<Byte>& record) override;
    Result<std::vector<Byte>> Load(const std::string& key) override;
    bool Exists(const std::string& key) override;
    Status Delete(const std::string& key) override;

    /// Stored keys in sorted order
    std::vector<std::string> Keys() const;

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Byte>> records_;
};

// ============================================================================
// Typed Records
// ============================================================================

template<typename T>
Status SaveRecord(Storage& storage, const std::string& key, const T& value) {
    DataStream ss;
    ss << value;
    return storage.Save(key, ss.Data());
}

template<typename T>
Result<T> LoadRecord(Storage& storage, const std::string& key) {
    auto bytes = storage.Load(key);
    if (!bytes) {
        return bytes.status();
    }
    DataStream ss(bytes.Take());
    T value;
    try {
        ss >> value;
    } catch (const std::ios_base::failure& e) {
        return Status::Serialization("Corrupt record '" + key + "': " + e.what());
    }
    if (!ss.empty()) {
        return Status::Serialization("Corrupt record '" + key + "': trailing bytes");
    }
    return value;
}

} // namespace storage
} // namespace nockledger

#endif // NOCKLEDGER_STORAGE_STORAGE_H

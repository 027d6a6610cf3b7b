// NOCKLEDGER - Storage Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/storage/storage.h"
#include "nockledger/util/logging.h"

namespace nockledger {
namespace storage {

Status MemoryStorage::Save(const std::string& key, const std::vector<Byte>& record) {
    if (key.empty()) {
        return Status::Storage("Empty storage key");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    records_[key] = record;
    LOG_TRACE(util::LogCategory::STORAGE) << "Saved '" << key << "' (" << record.size() << " bytes)";
    return Status::Ok();
}

Result<std::vector<Byte>> MemoryStorage::Load(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) {
        return Status::Storage("Record not found: " + key);
    }
    return it->second;
}

bool MemoryStorage::Exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(key) > 0;
}

Status MemoryStorage::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(key) == 0) {
        return Status::Storage("Record not found: " + key);
    }
    return Status::Ok();
}

std::vector<std::string> MemoryStorage::Keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(records_.size());
    for (const auto& entry : records_) {
        keys.push_back(entry.first);
    }
    return keys;
}

size_t MemoryStorage::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace storage
} // namespace nockledger

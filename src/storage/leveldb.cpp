// NOCKLEDGER - LevelDB Storage Implementation
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License

#include "nockledger/storage/leveldb.h"
#include "nockledger/util/logging.h"

#include <leveldb/iterator.h>
#include <leveldb/options.h>

namespace nockledger {
namespace storage {

Result<std::unique_ptr<LevelDBStorage>> LevelDBStorage::Open(const std::string& path,
                                                             bool createIfMissing) {
    leveldb::Options options;
    options.create_if_missing = createIfMissing;

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(options, path, &db);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::STORAGE) << "Failed to open " << path << ": " << s.ToString();
        return ConvertStatus(s);
    }

    LOG_INFO(util::LogCategory::STORAGE) << "Opened LevelDB storage at " << path;
    return std::unique_ptr<LevelDBStorage>(new LevelDBStorage(db, path));
}

LevelDBStorage::LevelDBStorage(leveldb::DB* db, const std::string& path)
    : db_(db), path_(path) {}

LevelDBStorage::~LevelDBStorage() = default;

Status LevelDBStorage::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    return Status::Storage(s.ToString());
}

Status LevelDBStorage::Save(const std::string& key, const std::vector<Byte>& record) {
    if (key.empty()) {
        return Status::Storage("Empty storage key");
    }
    leveldb::Slice value(reinterpret_cast<const char*>(record.data()), record.size());
    Status s = ConvertStatus(db_->Put(leveldb::WriteOptions(), key, value));
    if (s.ok()) {
        LOG_TRACE(util::LogCategory::STORAGE) << "Saved '" << key << "' (" << record.size() << " bytes)";
    }
    return s;
}

Result<std::vector<Byte>> LevelDBStorage::Load(const std::string& key) {
    std::string value;
    leveldb::Status s = db_->Get(leveldb::ReadOptions(), key, &value);
    if (s.IsNotFound()) {
        return Status::Storage("Record not found: " + key);
    }
    if (!s.ok()) {
        return ConvertStatus(s);
    }
    return std::vector<Byte>(value.begin(), value.end());
}

bool LevelDBStorage::Exists(const std::string& key) {
    std::string value;
    return db_->Get(leveldb::ReadOptions(), key, &value).ok();
}

Status LevelDBStorage::Delete(const std::string& key) {
    if (!Exists(key)) {
        return Status::Storage("Record not found: " + key);
    }
    return ConvertStatus(db_->Delete(leveldb::WriteOptions(), key));
}

std::vector<std::string> LevelDBStorage::Keys() const {
    std::vector<std::string> keys;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    return keys;
}

} // namespace storage
} // namespace nockledger

// NOCKLEDGER - LevelDB Storage
// Copyright (c) 2024 NOCKLEDGER Developers
// MIT License
//
// On-disk Storage backed by LevelDB. Only available when the build found
// LevelDB and defined NOCKLEDGER_USE_LEVELDB.

#ifndef NOCKLEDGER_STORAGE_LEVELDB_H
#define NOCKLEDGER_STORAGE_LEVELDB_H

#include "nockledger/storage/storage.h"

#ifdef NOCKLEDGER_USE_LEVELDB

#include <leveldb/db.h>

#include <memory>
#include <string>
#include <vector>

namespace nockledger {
namespace storage {

class LevelDBStorage : public Storage {
public:
    /// Open (or create) the database directory at `path`
    static Result<std::unique_ptr<LevelDBStorage>> Open(const std::string& path,
                                                        bool createIfMissing = true);

    ~LevelDBStorage() override;

    LevelDBStorage(const LevelDBStorage&) = delete;
    LevelDBStorage& operator=(const LevelDBStorage&) = delete;

    Status Save(const std::string& key, const std::vector<Byte>& record) override;
    Result<std::vector<Byte>> Load(const std::string& key) override;
    bool Exists(const std::string& key) override;
    Status Delete(const std::string& key) override;

    /// Stored keys in sorted order
    std::vector<std::string> Keys() const;

    const std::string& GetPath() const { return path_; }

private:
    LevelDBStorage(leveldb::DB* db, const std::string& path);

    static Status ConvertStatus(const leveldb::Status& s);

    std::unique_ptr<leveldb::DB> db_;
    std::string path_;
};

} // namespace storage
} // namespace nockledger

#endif // NOCKLEDGER_USE_LEVELDB

#endif // NOCKLEDGER_STORAGE_LEVELDB_H

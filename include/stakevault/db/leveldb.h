// STAKEVAULT - LevelDB Wrapper
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// LevelDB implementation of the database interface.

#ifndef STAKEVAULT_DB_LEVELDB_H
#define STAKEVAULT_DB_LEVELDB_H

#include "stakevault/db/database.h"

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <memory>

namespace stakevault {
namespace db {

/// Convert a LevelDB status into ours
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;

public:
    /// Takes ownership of an open handle
    explicit LevelDBDatabase(leveldb::DB* db) : db_(db) {}

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
};

} // namespace db
} // namespace stakevault

#endif // STAKEVAULT_DB_LEVELDB_H

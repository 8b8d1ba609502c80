// STAKEVAULT - LevelDB Wrapper Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/db/leveldb.h"

namespace stakevault {
namespace db {

namespace {

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // namespace

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    leveldb::Slice lkey(key.data(), key.size());
    return FromLevelDBStatus(db_->Get(MakeReadOptions(options), lkey, value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::Slice lkey(key.data(), key.size());
    leveldb::Slice lval(value.data(), value.size());
    return FromLevelDBStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::Slice lkey(key.data(), key.size());
    return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options), lkey));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

} // namespace db
} // namespace stakevault

// STAKEVAULT - In-Memory Database
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// std::map backed implementation of the database interface, used by tests
// and by callers that do not need the ledger to outlive the process.

#ifndef STAKEVAULT_DB_MEMORYDB_H
#define STAKEVAULT_DB_MEMORYDB_H

#include "stakevault/db/database.h"

#include <map>
#include <mutex>

namespace stakevault {
namespace db {

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot of the contents taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();
};

} // namespace db
} // namespace stakevault

#endif // STAKEVAULT_DB_MEMORYDB_H

// STAKEVAULT - Database Implementation
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/db/database.h"
#include "stakevault/db/leveldb.h"
#include "stakevault/db/memorydb.h"
#include "stakevault/util/logging.h"

#include <system_error>

namespace stakevault {
namespace db {

std::string Status::ToString() const {
    const char* name = "Unknown";
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: name = "NotFound"; break;
        case CORRUPTION: name = "Corruption"; break;
        case INVALID_ARGUMENT: name = "InvalidArgument"; break;
        case IO_ERROR: name = "IOError"; break;
    }
    return message_.empty() ? std::string(name) : std::string(name) + ": " + message_;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path().empty()
                                                ? path : path.parent_path(), ec);
        if (ec) {
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = true;

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened database " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

// ============================================================================
// MemoryDatabase
// ============================================================================

namespace {

/// Iterator over an owned copy of the map
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

} // namespace db
} // namespace stakevault

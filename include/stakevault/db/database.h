// STAKEVAULT - Database Abstraction Layer
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Abstract key-value store interface used to persist the vault ledger.
// The production backend is LevelDB; an in-memory store backs the tests.

#ifndef STAKEVAULT_DB_DATABASE_H
#define STAKEVAULT_DB_DATABASE_H

#include "stakevault/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stakevault {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of a store operation. Loading a vault reports malformed or
 * inconsistent records as Corruption.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        INVALID_ARGUMENT,
        IO_ERROR,
    };

    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status InvalidArgument(std::string msg = "") {
        return Status(INVALID_ARGUMENT, std::move(msg));
    }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * A lightweight reference to a contiguous range of bytes.
 * Does not own the data - the underlying buffer must outlive the Slice.
 */
class Slice {
private:
    const char* data_;
    size_t size_;

public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    /// True if this slice begins with the bytes of x
    bool starts_with(const Slice& x) const {
        return size_ >= x.size_ && memcmp(data_, x.data_, x.size_) == 0;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && memcmp(data_, b.data_, size_) == 0;
    }

    bool operator!=(const Slice& b) const { return !(*this == b); }
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
};

struct ReadOptions {
    bool verify_checksums = true;
};

struct WriteOptions {
    /// Wait for the write to reach disk
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }

    size_t Count() const { return operations_.size(); }

    bool Empty() const { return operations_.empty(); }

    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;

    virtual void Next() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;

    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;

    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;

    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    /// Check if a key exists
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a LevelDB database at the specified path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Destroy a database (delete all data)
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

/// Deserialize an object; false if the bytes are truncated or malformed
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(data);
        Unserialize(ss, obj);
        return true;
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    constexpr char PARAMS = 'P';       // -> vault parameters
    constexpr char FLAG = 'F';         // name -> flag / counter value
    constexpr char ENTRY = 'E';        // asset id (big-endian) -> stake entry
    constexpr char BOOK = 'L';         // name -> serialized local ledger
}

/**
 * Create a prefixed database key.
 */
inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace stakevault

#endif // STAKEVAULT_DB_DATABASE_H

// StakeLedger - Database Abstraction Layer
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Abstract key-value store used to persist ledger snapshots. Backed by
// LevelDB when available, otherwise by an in-memory map.

#ifndef STAKELEDGER_DB_DATABASE_H
#define STAKELEDGER_DB_DATABASE_H

#include "stakeledger/core/serialize.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <ios>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stakeledger {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        IO_ERROR = 4,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsNotSupported() const { return code_ == NOT_SUPPORTED; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        const char* name = "Unknown: ";
        switch (code_) {
            case NOT_FOUND: name = "NotFound: "; break;
            case CORRUPTION: name = "Corruption: "; break;
            case NOT_SUPPORTED: name = "NotSupported: "; break;
            case IO_ERROR: name = "IOError: "; break;
            default: break;
        }
        return name + message_;
    }

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - Non-owning reference to a byte range
// ============================================================================

class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    char operator[](size_t n) const { return data_[n]; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    int compare(const Slice& b) const {
        size_t min_len = std::min(size_, b.size_);
        int r = min_len == 0 ? 0 : memcmp(data_, b.data_, min_len);
        if (r == 0) {
            if (size_ < b.size_) r = -1;
            else if (size_ > b.size_) r = +1;
        }
        return r;
    }

    bool operator==(const Slice& b) const { return compare(b) == 0; }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

enum class Backend {
    LevelDB,
    Memory,
};

struct Options {
    Backend backend = Backend::LevelDB;

    bool create_if_missing = true;

    /// LRU block cache (the "dbcache" setting)
    size_t block_cache_size = 8 * 1024 * 1024;

    int bloom_filter_bits = 10;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    size_t Count() const { return operations_.size(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key >= target
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

    virtual Status Get(const Slice& key, std::string* value) = 0;

    virtual Status Put(const Slice& key, const Slice& value) = 0;

    virtual Status Delete(const Slice& key) = 0;

    /// Apply all operations in the batch atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;

    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    /// Iterator over a consistent view of the store
    virtual std::unique_ptr<Iterator> NewIterator() = 0;

    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    /// Backend name ("leveldb", "memory")
    virtual const char* Name() const = 0;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a database at the given path.
 *
 * Backend::LevelDB falls back to the in-memory store when the library was
 * not available at build time; the fallback is logged.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Remove all data stored at path
Status DestroyDatabase(const std::filesystem::path& path);

/// True if this build links LevelDB
bool HaveLevelDB();

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.str();
}

/// Returns false on truncated or trailing data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_DATABASE_H

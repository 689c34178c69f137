// StakeLedger - Database Backends
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// LevelDB implementation of the database interface (when built with
// STAKELEDGER_USE_LEVELDB) and the in-memory store.

#ifndef STAKELEDGER_DB_LEVELDB_H
#define STAKELEDGER_DB_LEVELDB_H

#include "stakeledger/db/database.h"

#include <map>
#include <mutex>

#ifdef STAKELEDGER_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>
#endif

namespace stakeledger {
namespace db {

#ifdef STAKELEDGER_USE_LEVELDB

// ============================================================================
// LevelDB Backend
// ============================================================================

inline Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    return Status::IOError(s.ToString());
}

inline leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override { iter_->Seek(ToLevelDB(target)); }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDB(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    using Database::Write;

    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : cache_(cache), filter_policy_(filter), db_(db) {}

    Status Get(const Slice& key, std::string* value) override {
        return FromLevelDB(db_->Get(leveldb::ReadOptions(), ToLevelDB(key), value));
    }

    Status Put(const Slice& key, const Slice& value) override {
        return FromLevelDB(db_->Put(leveldb::WriteOptions(), ToLevelDB(key), ToLevelDB(value)));
    }

    Status Delete(const Slice& key) override {
        return FromLevelDB(db_->Delete(leveldb::WriteOptions(), ToLevelDB(key)));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        leveldb::WriteOptions lo;
        lo.sync = options.sync;
        return FromLevelDB(db_->Write(lo, &lb));
    }

    std::unique_ptr<Iterator> NewIterator() override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
    }

    const char* Name() const override { return "leveldb"; }

private:
    // Declaration order matters: db_ is destroyed before the cache and
    // filter it references.
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
    std::unique_ptr<leveldb::DB> db_;
};

#endif // STAKELEDGER_USE_LEVELDB

// ============================================================================
// In-Memory Backend
// ============================================================================

/// Iterates over a private copy of the store taken at creation time
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

class MemoryDatabase : public Database {
public:
    using Database::Write;

    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound(key.ToString());
        }
        *value = it->second;
        return Status::Ok();
    }

    Status Put(const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }

    Status Delete(const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }

    Status Write(const WriteOptions&, WriteBatch* batch) override {
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

    std::unique_ptr<Iterator> NewIterator() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::make_unique<MemoryIterator>(data_);
    }

    const char* Name() const override { return "memory"; }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_LEVELDB_H

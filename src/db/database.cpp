// StakeLedger - Database Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/db/database.h"
#include "stakeledger/db/leveldb.h"
#include "stakeledger/util/logging.h"

#include <system_error>

namespace stakeledger {
namespace db {

bool HaveLevelDB() {
#ifdef STAKELEDGER_USE_LEVELDB
    return true;
#else
    return false;
#endif
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.backend == Backend::Memory) {
        return {Status::Ok(), std::make_unique<MemoryDatabase>()};
    }

#ifdef STAKELEDGER_USE_LEVELDB
    std::error_code ec;
    if (options.create_if_missing) {
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDB(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(raw, cache, filter)};
#else
    LOG_WARN(util::LogCategory::DB) << "Built without LevelDB; using in-memory storage for "
                                    << path.string();
    return {Status::Ok(), std::make_unique<MemoryDatabase>()};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef STAKELEDGER_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return FromLevelDB(s);
    }
#endif
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
}

} // namespace db
} // namespace stakeledger

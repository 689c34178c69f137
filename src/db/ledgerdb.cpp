// StakeLedger - Ledger Database Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/db/ledgerdb.h"
#include "stakeledger/util/logging.h"

#include <map>
#include <set>

namespace stakeledger {
namespace db {

namespace {

const char* const NEXT_POOL = "nextpool";

constexpr size_t POOL_KEY_SIZE = 1 + 8;
constexpr size_t POSITION_KEY_SIZE = 1 + 8 + AccountId::SIZE;

void AppendBigEndian(std::string& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xff));
    }
}

uint64_t ReadBigEndian(const char* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data[i]);
    }
    return value;
}

std::string VersionKey() {
    return std::string(1, prefix::VERSION);
}

} // namespace

// ============================================================================
// Keys
// ============================================================================

std::string PoolKey(PoolId poolId) {
    std::string key(1, prefix::POOL);
    AppendBigEndian(key, poolId);
    return key;
}

std::string PositionKey(PoolId poolId, const AccountId& account) {
    std::string key(1, prefix::POSITION);
    AppendBigEndian(key, poolId);
    key.append(reinterpret_cast<const char*>(account.data()), AccountId::SIZE);
    return key;
}

std::string MetaKey(const std::string& name) {
    return std::string(1, prefix::META) + name;
}

// ============================================================================
// LedgerDB Implementation
// ============================================================================

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

std::pair<Status, std::unique_ptr<LedgerDB>> LedgerDB::Open(
    const std::filesystem::path& path,
    const Options& options)
{
    auto [status, database] = OpenDatabase(path, options);
    if (!status.ok()) {
        return {status, nullptr};
    }
    LOG_INFO(util::LogCategory::DB) << "Ledger database ready (" << database->Name() << ")";
    return {Status::Ok(), std::make_unique<LedgerDB>(std::move(database))};
}

bool LedgerDB::IsEmpty() {
    return !db_->Exists(VersionKey());
}

Status LedgerDB::WriteSnapshot(const ledger::LedgerSnapshot& snapshot, bool sync) {
    WriteBatch batch;
    std::set<std::string> live;

    for (const auto& entry : snapshot.pools) {
        std::string key = PoolKey(entry.pool.id);
        batch.Put(key, SerializeToString(entry.pool));
        live.insert(key);

        for (const auto& [account, position] : entry.positions) {
            std::string posKey = PositionKey(entry.pool.id, account);
            batch.Put(posKey, SerializeToString(position));
            live.insert(posKey);
        }
    }

    // Drop records that are no longer part of the state
    size_t stale = 0;
    auto iter = db_->NewIterator();
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        Slice key = iter->key();
        if (key.empty() || (key[0] != prefix::POOL && key[0] != prefix::POSITION)) {
            continue;
        }
        std::string k = key.ToString();
        if (live.count(k) == 0) {
            batch.Delete(k);
            ++stale;
        }
    }
    Status s = iter->status();
    if (!s.ok()) {
        return s;
    }

    batch.Put(MetaKey(NEXT_POOL), SerializeToString(snapshot.nextPoolId));
    batch.Put(VersionKey(), SerializeToString(LEDGER_SCHEMA_VERSION));

    WriteOptions options;
    options.sync = sync;
    s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Snapshot write failed: " << s.ToString();
        return s;
    }

    ++nWrites_;
    LOG_DEBUG(util::LogCategory::DB) << "Wrote snapshot: " << snapshot.pools.size()
                                     << " pools, " << batch.Count() << " operations, "
                                     << stale << " stale records removed";
    return Status::Ok();
}

Status LedgerDB::ReadSnapshot(ledger::LedgerSnapshot* snapshot) {
    ledger::LedgerSnapshot result;

    std::string value;
    Status s = db_->Get(VersionKey(), &value);
    if (s.IsNotFound()) {
        *snapshot = result;
        return Status::Ok();
    }
    if (!s.ok()) {
        return s;
    }

    uint32_t version = 0;
    if (!DeserializeFromString(value, version)) {
        return Status::Corruption("unreadable schema version");
    }
    if (version != LEDGER_SCHEMA_VERSION) {
        return Status::NotSupported("schema version " + std::to_string(version));
    }

    s = db_->Get(MetaKey(NEXT_POOL), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? Status::Corruption("missing next pool id") : s;
    }
    if (!DeserializeFromString(value, result.nextPoolId)) {
        return Status::Corruption("unreadable next pool id");
    }

    std::map<PoolId, ledger::PoolSnapshot> pools;

    auto iter = db_->NewIterator();
    iter->Seek(std::string(1, prefix::POOL));
    for (; iter->Valid() && iter->key().size() > 0 && iter->key()[0] == prefix::POOL;
         iter->Next()) {
        Slice key = iter->key();
        if (key.size() != POOL_KEY_SIZE) {
            return Status::Corruption("malformed pool key");
        }
        PoolId id = ReadBigEndian(key.data() + 1);

        ledger::PoolSnapshot entry;
        if (!DeserializeFromString(iter->value().ToString(), entry.pool)) {
            return Status::Corruption("unreadable record for pool " + std::to_string(id));
        }
        if (entry.pool.id != id) {
            return Status::Corruption("pool record " + std::to_string(entry.pool.id) +
                                      " stored under key " + std::to_string(id));
        }
        if (id >= result.nextPoolId) {
            return Status::Corruption("pool " + std::to_string(id) + " not below next pool id");
        }
        pools.emplace(id, std::move(entry));
    }
    s = iter->status();
    if (!s.ok()) {
        return s;
    }

    iter->Seek(std::string(1, prefix::POSITION));
    for (; iter->Valid() && iter->key().size() > 0 && iter->key()[0] == prefix::POSITION;
         iter->Next()) {
        Slice key = iter->key();
        if (key.size() != POSITION_KEY_SIZE) {
            return Status::Corruption("malformed position key");
        }
        PoolId id = ReadBigEndian(key.data() + 1);
        AccountId account(reinterpret_cast<const Byte*>(key.data() + 9), AccountId::SIZE);

        auto it = pools.find(id);
        if (it == pools.end()) {
            return Status::Corruption("position for unknown pool " + std::to_string(id));
        }

        ledger::StakePosition position;
        if (!DeserializeFromString(iter->value().ToString(), position)) {
            return Status::Corruption("unreadable position " + account.ToHex() +
                                      " in pool " + std::to_string(id));
        }
        it->second.positions.emplace(account, position);
    }
    s = iter->status();
    if (!s.ok()) {
        return s;
    }

    for (auto& [id, entry] : pools) {
        Amount sum = 0;
        for (const auto& [account, position] : entry.positions) {
            auto next = CheckedAdd(sum, position.amount);
            if (!next || position.amount < 0) {
                return Status::Corruption("invalid position amounts in pool " + std::to_string(id));
            }
            sum = *next;
        }
        if (sum != entry.pool.totalStaked) {
            return Status::Corruption("pool " + std::to_string(id) + " totalStaked " +
                                      std::to_string(entry.pool.totalStaked) +
                                      " != stored positions " + std::to_string(sum));
        }
        result.pools.push_back(std::move(entry));
    }

    LOG_DEBUG(util::LogCategory::DB) << "Read snapshot: " << result.pools.size()
                                     << " pools, next id " << result.nextPoolId;
    *snapshot = std::move(result);
    return Status::Ok();
}

Status LedgerDB::ReadPool(PoolId poolId, ledger::Pool* pool) {
    std::string value;
    Status s = db_->Get(PoolKey(poolId), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, *pool)) {
        return Status::Corruption("unreadable record for pool " + std::to_string(poolId));
    }
    return Status::Ok();
}

Status LedgerDB::ReadPosition(PoolId poolId, const AccountId& account,
                              ledger::StakePosition* position) {
    std::string value;
    Status s = db_->Get(PositionKey(poolId, account), &value);
    if (!s.ok()) {
        return s;
    }
    if (!DeserializeFromString(value, *position)) {
        return Status::Corruption("unreadable position " + account.ToHex());
    }
    return Status::Ok();
}

} // namespace db
} // namespace stakeledger

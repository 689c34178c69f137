// StakeLedger - Ledger Database
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Persistent pool and position tables on top of the key-value database.

#ifndef STAKELEDGER_DB_LEDGERDB_H
#define STAKELEDGER_DB_LEDGERDB_H

#include "stakeledger/db/database.h"
#include "stakeledger/ledger/types.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace stakeledger {
namespace db {

// ============================================================================
// Key Layout
// ============================================================================

namespace prefix {
    constexpr char POOL = 'P';       // pool id (8 bytes BE) -> Pool
    constexpr char POSITION = 'S';   // pool id (8 bytes BE) + account -> StakePosition
    constexpr char META = 'M';       // name -> value
    constexpr char VERSION = 'V';    // -> schema version
}

/// Schema version written with every snapshot
constexpr uint32_t LEDGER_SCHEMA_VERSION = 1;

std::string PoolKey(PoolId poolId);

std::string PositionKey(PoolId poolId, const AccountId& account);

std::string MetaKey(const std::string& name);

// ============================================================================
// LedgerDB
// ============================================================================

/**
 * Pool and position tables keyed as above.
 *
 * The ledger is persisted as whole snapshots: WriteSnapshot replaces the
 * stored state in one atomic batch, deleting records that are no longer
 * present. ReadSnapshot verifies that each pool's totalStaked equals the
 * sum of its stored positions.
 */
class LedgerDB {
public:
    explicit LedgerDB(std::unique_ptr<Database> db);

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /// Open (or create) the database at path and wrap it
    static std::pair<Status, std::unique_ptr<LedgerDB>> Open(
        const std::filesystem::path& path,
        const Options& options = Options());

    /// Replace the stored state with snapshot
    Status WriteSnapshot(const ledger::LedgerSnapshot& snapshot, bool sync = true);

    /// Load the stored state. An empty database yields an empty snapshot.
    Status ReadSnapshot(ledger::LedgerSnapshot* snapshot);

    Status ReadPool(PoolId poolId, ledger::Pool* pool);

    Status ReadPosition(PoolId poolId, const AccountId& account,
                        ledger::StakePosition* position);

    /// True if no snapshot has been written yet
    bool IsEmpty();

    const char* BackendName() const { return db_->Name(); }

    uint64_t GetWriteCount() const { return nWrites_; }

private:
    std::unique_ptr<Database> db_;
    std::atomic<uint64_t> nWrites_{0};
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_LEDGERDB_H

// StakeLedger - Pool and Position Stores
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Owned in-memory state of the ledger. A PoolSlot bundles one pool with
// its positions and the mutex that serializes every mutation of them.
// Slots are created once and never removed, so a slot pointer obtained
// from the PoolStore stays valid for the store's lifetime.

#ifndef STAKELEDGER_LEDGER_STORE_H
#define STAKELEDGER_LEDGER_STORE_H

#include "stakeledger/ledger/types.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Position Store
// ============================================================================

/// Positions of a single pool keyed by account
class PositionStore {
public:
    /// nullptr when the account never staked
    const StakePosition* Find(const AccountId& account) const;

    void Put(const AccountId& account, const StakePosition& position);

    const std::map<AccountId, StakePosition>& All() const { return positions_; }

private:
    std::map<AccountId, StakePosition> positions_;
};

// ============================================================================
// Pool Slot
// ============================================================================

struct PoolSlot {
    explicit PoolSlot(const Pool& p) : pool(p) {}

    std::mutex mutex;

    /// Thread currently inside a mutation of this pool (default id = none)
    std::atomic<std::thread::id> owner{std::thread::id()};

    Pool pool;
    PositionStore positions;
};

// ============================================================================
// Pool Store
// ============================================================================

/**
 * Pool table. Lookups take the table lock shared; only Insert and
 * Load take it exclusively.
 */
class PoolStore {
public:
    PoolStore() = default;

    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    /// nullptr for unknown ids
    PoolSlot* Find(PoolId id) const;

    /**
     * Assign the next id to pool, let init fill id-dependent fields, and
     * store it. Returns the new slot.
     */
    PoolSlot* Insert(Pool pool, const std::function<void(Pool&)>& init);

    /// Ids in ascending order
    std::vector<PoolId> Ids() const;

    /// All slots in ascending id order, and the next id at the same instant
    std::vector<PoolSlot*> Slots(PoolId* nextId = nullptr) const;

    size_t Size() const;

    /**
     * Load pools and positions into an empty store. Fails (returns false)
     * if the store already holds pools.
     */
    bool Load(const LedgerSnapshot& snapshot);

private:
    mutable std::shared_mutex mutex_;
    std::map<PoolId, std::unique_ptr<PoolSlot>> slots_;
    PoolId nextId_{FIRST_POOL_ID};
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_STORE_H

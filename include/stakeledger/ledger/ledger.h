// StakeLedger - Staking Ledger
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Time-weighted staking reward ledger.
//
// Key features:
// - Any number of pools, each with its own staking and reward asset
// - O(1) reward accounting per operation (reward-per-token accumulator)
// - Checkpoint before every mutation, integer math only
// - Per-pool locking; operations on different pools run in parallel
// - All-or-nothing mutations: state is committed only after the asset
//   transfer succeeds

#ifndef STAKELEDGER_LEDGER_LEDGER_H
#define STAKELEDGER_LEDGER_LEDGER_H

#include "stakeledger/ledger/clock.h"
#include "stakeledger/ledger/interfaces.h"
#include "stakeledger/ledger/status.h"
#include "stakeledger/ledger/store.h"
#include "stakeledger/ledger/types.h"

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace stakeledger {
namespace ledger {

/**
 * The accrual engine.
 *
 * Every mutation follows the same sequence under the pool's lock:
 * checkpoint the pool (and the acting position) on working copies, apply
 * the change, run the asset transfer, then commit the copies. Any failure
 * before the commit leaves the ledger unchanged.
 *
 * Asset transfers run while the pool is locked. A transfer that calls back
 * into the same pool fails with a StateError instead of deadlocking.
 */
class StakingLedger {
public:
    using EventCallback = std::function<void(const LedgerEvent&)>;

    StakingLedger(std::shared_ptr<AssetLedger> assets,
                  std::shared_ptr<AccessControl> access,
                  std::shared_ptr<Clock> clock);
    ~StakingLedger();

    StakingLedger(const StakingLedger&) = delete;
    StakingLedger& operator=(const StakingLedger&) = delete;

    // === Administration (pool-admin role) ===

    LedgerStatus CreatePool(const AccountId& caller, const PoolParams& params, PoolId* poolId);

    /// Checkpoints the pool, then switches to newRate (0 pauses emission)
    LedgerStatus SetRewardRate(const AccountId& caller, PoolId poolId, Amount newRate);

    /// An inactive pool rejects stakes; withdrawals and claims still work
    LedgerStatus SetPoolActive(const AccountId& caller, PoolId poolId, bool active);

    LedgerStatus UpdatePoolLimits(const AccountId& caller, PoolId poolId,
                                  Duration lockupPeriod, Amount minStake);

    // === Funding (any account) ===

    /// Move reward asset from funder into the pool's reward reserve
    LedgerStatus FundRewards(const AccountId& funder, PoolId poolId, Amount amount);

    // === Staking ===

    LedgerStatus Stake(PoolId poolId, const AccountId& account, Amount amount);

    LedgerStatus Withdraw(PoolId poolId, const AccountId& account, Amount amount);

    /// Pays out all pending rewards. Nothing pending: *claimed = 0, Ok.
    LedgerStatus ClaimReward(PoolId poolId, const AccountId& account, Amount* claimed);

    // === Queries ===

    LedgerStatus Earned(PoolId poolId, const AccountId& account, Amount* earned) const;

    LedgerStatus RewardPerToken(PoolId poolId, Uint128* rewardPerToken) const;

    LedgerStatus GetStakeInfo(PoolId poolId, const AccountId& account, StakeInfo* info) const;

    LedgerStatus GetPositionState(PoolId poolId, const AccountId& account,
                                  PositionState* state) const;

    LedgerStatus GetPool(PoolId poolId, Pool* pool) const;

    std::vector<PoolId> ListPoolIds() const;

    size_t PoolCount() const;

    // === Snapshots ===

    /// Consistent copy of every pool and position
    LedgerStatus ExportSnapshot(LedgerSnapshot* snapshot) const;

    /// Load state into a ledger that has no pools yet
    LedgerStatus ImportSnapshot(const LedgerSnapshot& snapshot);

    // === Configuration ===

    /// Called after each committed mutation, with no pool lock held
    void SetEventCallback(EventCallback callback);

    const Clock& GetClock() const { return *clock_; }

    static AccountId DeriveCustodyAccount(PoolId poolId);

    static AccountId DeriveRewardReserve(PoolId poolId);

private:
    LedgerStatus RequireAdmin(const AccountId& caller, const char* operation) const;

    LedgerStatus FindPool(PoolId poolId, PoolSlot** slot) const;

    /// Clock reading, clamped so it never precedes the pool's last checkpoint
    Timestamp EffectiveNow(const Pool& pool) const;

    void Emit(const LedgerEvent& event);

    std::shared_ptr<AssetLedger> assets_;
    std::shared_ptr<AccessControl> access_;
    std::shared_ptr<Clock> clock_;

    PoolStore pools_;

    std::mutex callbackMutex_;
    EventCallback eventCallback_;
};

/// Validate pool parameters shared by CreatePool and UpdatePoolLimits
LedgerStatus ValidatePoolLimits(Duration lockupPeriod, Amount minStake);

/// Check the invariants of a snapshot (totals, ids, accumulator ordering)
LedgerStatus ValidateSnapshot(const LedgerSnapshot& snapshot);

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_LEDGER_H

// StakeLedger - Ledger Records
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Pool and position records, pool parameters and ledger events.

#ifndef STAKELEDGER_LEDGER_TYPES_H
#define STAKELEDGER_LEDGER_TYPES_H

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"

#include <map>
#include <string>
#include <vector>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Constants
// ============================================================================

/// Fixed-point scale of reward-per-token values (10^18)
constexpr Uint128 PRECISION = static_cast<Uint128>(1000000000000000000ULL);

/// First pool id handed out by a fresh ledger
constexpr PoolId FIRST_POOL_ID = 1;

// ============================================================================
// Enums
// ============================================================================

/// When the lockup clock of a position starts
enum class LockupPolicy : uint8_t {
    FromFirstStake = 0,   // measured from the first stake since the last full withdrawal
    ResetOnTopUp = 1,     // every stake restarts the lockup
};

const char* LockupPolicyToString(LockupPolicy policy);

/// Parse "fromfirststake" / "resetontopup" (case-insensitive)
bool ParseLockupPolicy(const std::string& str, LockupPolicy& out);

enum class PositionState {
    Unstaked,         // no record
    Active,           // amount > 0
    FullyWithdrawn,   // record kept, amount == 0
};

const char* PositionStateToString(PositionState state);

// ============================================================================
// Pool
// ============================================================================

/// Parameters supplied by an admin when creating a pool
struct PoolParams {
    AssetId stakingAsset;
    AssetId rewardAsset;

    /// Reward units issued per second across the whole pool
    Amount rewardRate{0};

    Duration lockupPeriod{0};
    Amount minStake{1};
    LockupPolicy lockupPolicy{LockupPolicy::FromFirstStake};
};

/**
 * Global accrual state of one pool.
 *
 * rewardPerTokenStored is the cumulative reward per staked unit since
 * creation, scaled by PRECISION. It only ever grows.
 */
struct Pool {
    PoolId id{0};
    AssetId stakingAsset;
    AssetId rewardAsset;

    Amount rewardRate{0};
    Timestamp lastUpdateTime{0};
    Uint128 rewardPerTokenStored{0};
    Amount totalStaked{0};

    Duration lockupPeriod{0};
    Amount minStakeAmount{1};
    bool active{true};

    Timestamp createdAt{0};
    Amount totalRewardsPaid{0};
    LockupPolicy lockupPolicy{LockupPolicy::FromFirstStake};

    /// Asset ledger account holding staked funds
    AccountId custodyAccount;
    /// Asset ledger account rewards are paid from
    AccountId rewardReserve;

    std::string ToString() const;
};

// ============================================================================
// Position
// ============================================================================

/// Stake of one account in one pool
struct StakePosition {
    Amount amount{0};

    /// First stake since the last full withdrawal
    Timestamp stakingTime{0};
    Timestamp lastStakeTime{0};

    /// Pool rewardPerTokenStored at this position's last checkpoint
    Uint128 rewardPerTokenPaid{0};

    /// Rewards banked at the last checkpoint and not yet claimed
    Amount pendingRewards{0};

    bool active{false};

    Amount totalClaimed{0};

    PositionState State() const {
        return amount > 0 ? PositionState::Active : PositionState::FullyWithdrawn;
    }
};

/// Read-only view returned by GetStakeInfo
struct StakeInfo {
    PoolId poolId{0};
    AccountId account;
    PositionState state{PositionState::Unstaked};
    StakePosition position;

    /// Claimable rewards as of the query time
    Amount earned{0};

    /// Earliest time a withdrawal passes the lockup check
    Timestamp unlockTime{0};
};

// ============================================================================
// Snapshots
// ============================================================================

/// One pool with all of its positions
struct PoolSnapshot {
    Pool pool;
    std::map<AccountId, StakePosition> positions;
};

/// Complete ledger state, as exported for persistence
struct LedgerSnapshot {
    PoolId nextPoolId{FIRST_POOL_ID};
    std::vector<PoolSnapshot> pools;
};

// ============================================================================
// Events
// ============================================================================

enum class LedgerEventType {
    PoolCreated,
    Staked,
    Withdrawn,
    RewardClaimed,
    RewardRateChanged,
    PoolStatusChanged,
    PoolLimitsChanged,
    RewardsFunded,
};

const char* LedgerEventTypeToString(LedgerEventType type);

/// Record of a committed mutation, delivered to the event callback
struct LedgerEvent {
    LedgerEventType type{LedgerEventType::PoolCreated};
    PoolId poolId{0};

    /// Acting account (staker, claimer, funder or admin)
    AccountId account;

    /// Staked/withdrawn/claimed/funded amount, new rate, or 1/0 for status
    Amount amount{0};

    /// Rate before a RewardRateChanged event
    Amount previous{0};

    Timestamp time{0};

    std::string ToString() const;
};

// ============================================================================
// Serialization
// ============================================================================

// Storage records. Pool id and position key are carried by the database
// key, so they are not repeated here (Pool::id is, for cross-checking).

template<typename Stream>
void Serialize(Stream& s, const Pool& pool) {
    s << pool.id << pool.stakingAsset << pool.rewardAsset
      << pool.rewardRate << pool.lastUpdateTime << pool.rewardPerTokenStored
      << pool.totalStaked << pool.lockupPeriod << pool.minStakeAmount
      << pool.active << pool.createdAt << pool.totalRewardsPaid
      << static_cast<uint8_t>(pool.lockupPolicy)
      << pool.custodyAccount << pool.rewardReserve;
}

template<typename Stream>
void Unserialize(Stream& s, Pool& pool) {
    uint8_t policy = 0;
    s >> pool.id >> pool.stakingAsset >> pool.rewardAsset
      >> pool.rewardRate >> pool.lastUpdateTime >> pool.rewardPerTokenStored
      >> pool.totalStaked >> pool.lockupPeriod >> pool.minStakeAmount
      >> pool.active >> pool.createdAt >> pool.totalRewardsPaid
      >> policy
      >> pool.custodyAccount >> pool.rewardReserve;
    if (policy > static_cast<uint8_t>(LockupPolicy::ResetOnTopUp)) {
        throw std::ios_base::failure("Unserialize(): unknown lockup policy");
    }
    pool.lockupPolicy = static_cast<LockupPolicy>(policy);
}

template<typename Stream>
void Serialize(Stream& s, const StakePosition& position) {
    s << position.amount << position.stakingTime << position.lastStakeTime
      << position.rewardPerTokenPaid << position.pendingRewards
      << position.active << position.totalClaimed;
}

template<typename Stream>
void Unserialize(Stream& s, StakePosition& position) {
    s >> position.amount >> position.stakingTime >> position.lastStakeTime
      >> position.rewardPerTokenPaid >> position.pendingRewards
      >> position.active >> position.totalClaimed;
}

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_TYPES_H

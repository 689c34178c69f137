// StakeLedger - Reward Accrual
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Fixed-point reward-per-token accounting. All functions are pure and
// never wrap: any overflow is reported as an ArithmeticError and the
// outputs are left untouched.
//
//   rewardPerToken = stored                                 if totalStaked == 0
//                  = stored + elapsed * rate * PRECISION / totalStaked
//   earned         = amount * (rewardPerToken - paid) / PRECISION + pending
//
// Division floors, so rounding can only under-pay.

#ifndef STAKELEDGER_LEDGER_ACCRUAL_H
#define STAKELEDGER_LEDGER_ACCRUAL_H

#include "stakeledger/ledger/status.h"
#include "stakeledger/ledger/types.h"

namespace stakeledger {
namespace ledger {

/// Seconds accrued between the last checkpoint and now (never negative)
inline Duration AccrualElapsed(const Pool& pool, Timestamp now) {
    return now > pool.lastUpdateTime ? now - pool.lastUpdateTime : 0;
}

/// Current reward per token of a pool
LedgerStatus ComputeRewardPerToken(const Pool& pool, Timestamp now, Uint128* out);

/// Rewards owed to a position given the pool's current reward per token
LedgerStatus ComputeEarned(const StakePosition& position, Uint128 rewardPerToken,
                           Amount* out);

/// Bring the pool's stored accumulator up to now
LedgerStatus CheckpointPool(Pool& pool, Timestamp now);

/// Bank a position's accrual against an already-checkpointed pool
LedgerStatus CheckpointPosition(const Pool& pool, StakePosition& position);

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ACCRUAL_H

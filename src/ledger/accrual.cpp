// StakeLedger - Reward Accrual
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/accrual.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace ledger {

LedgerStatus ComputeRewardPerToken(const Pool& pool, Timestamp now, Uint128* out) {
    Duration elapsed = AccrualElapsed(pool, now);
    if (pool.totalStaked <= 0 || elapsed == 0 || pool.rewardRate <= 0) {
        *out = pool.rewardPerTokenStored;
        return LedgerStatus::Ok();
    }

    // elapsed and rate are both below 2^63, so their product fits in 126 bits
    Uint128 emitted = static_cast<Uint128>(elapsed) * static_cast<Uint128>(pool.rewardRate);
    auto scaled = CheckedMul128(emitted, PRECISION);
    if (!scaled) {
        return LedgerStatus::Arithmetic("reward emission overflow in pool " +
                                        std::to_string(pool.id));
    }

    Uint128 delta = *scaled / static_cast<Uint128>(pool.totalStaked);
    auto total = CheckedAdd128(pool.rewardPerTokenStored, delta);
    if (!total) {
        return LedgerStatus::Arithmetic("reward per token overflow in pool " +
                                        std::to_string(pool.id));
    }

    *out = *total;
    return LedgerStatus::Ok();
}

LedgerStatus ComputeEarned(const StakePosition& position, Uint128 rewardPerToken,
                           Amount* out) {
    if (position.rewardPerTokenPaid > rewardPerToken) {
        return LedgerStatus::Arithmetic("position snapshot ahead of pool accumulator");
    }

    Uint128 fresh = 0;
    if (position.amount > 0) {
        auto product = CheckedMul128(static_cast<Uint128>(position.amount),
                                     rewardPerToken - position.rewardPerTokenPaid);
        if (!product) {
            return LedgerStatus::Arithmetic("earned reward overflow");
        }
        fresh = *product / PRECISION;
    }

    Uint128 total = fresh + static_cast<Uint128>(position.pendingRewards);
    if (fresh > static_cast<Uint128>(MAX_AMOUNT) || total > static_cast<Uint128>(MAX_AMOUNT)) {
        return LedgerStatus::Arithmetic("earned reward exceeds amount range");
    }

    *out = static_cast<Amount>(total);
    return LedgerStatus::Ok();
}

LedgerStatus CheckpointPool(Pool& pool, Timestamp now) {
    Uint128 rpt = 0;
    LedgerStatus s = ComputeRewardPerToken(pool, now, &rpt);
    if (!s.ok()) {
        return s;
    }

    pool.rewardPerTokenStored = rpt;
    if (now > pool.lastUpdateTime) {
        pool.lastUpdateTime = now;
    }

    LOG_TRACE(util::LogCategory::ACCRUAL) << "pool " << pool.id << " checkpoint t="
                                          << pool.lastUpdateTime << " rpt="
                                          << Uint128ToString(rpt);
    return LedgerStatus::Ok();
}

LedgerStatus CheckpointPosition(const Pool& pool, StakePosition& position) {
    Amount earned = 0;
    LedgerStatus s = ComputeEarned(position, pool.rewardPerTokenStored, &earned);
    if (!s.ok()) {
        return s;
    }
    position.pendingRewards = earned;
    position.rewardPerTokenPaid = pool.rewardPerTokenStored;
    return LedgerStatus::Ok();
}

} // namespace ledger
} // namespace stakeledger

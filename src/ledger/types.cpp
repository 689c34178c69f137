// StakeLedger - Ledger Records
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/types.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace stakeledger {
namespace ledger {

const char* LockupPolicyToString(LockupPolicy policy) {
    switch (policy) {
        case LockupPolicy::FromFirstStake: return "FromFirstStake";
        case LockupPolicy::ResetOnTopUp: return "ResetOnTopUp";
    }
    return "Unknown";
}

bool ParseLockupPolicy(const std::string& str, LockupPolicy& out) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "fromfirststake" || lower == "first") {
        out = LockupPolicy::FromFirstStake;
        return true;
    }
    if (lower == "resetontopup" || lower == "reset") {
        out = LockupPolicy::ResetOnTopUp;
        return true;
    }
    return false;
}

const char* PositionStateToString(PositionState state) {
    switch (state) {
        case PositionState::Unstaked: return "Unstaked";
        case PositionState::Active: return "Active";
        case PositionState::FullyWithdrawn: return "FullyWithdrawn";
    }
    return "Unknown";
}

const char* LedgerEventTypeToString(LedgerEventType type) {
    switch (type) {
        case LedgerEventType::PoolCreated: return "PoolCreated";
        case LedgerEventType::Staked: return "Staked";
        case LedgerEventType::Withdrawn: return "Withdrawn";
        case LedgerEventType::RewardClaimed: return "RewardClaimed";
        case LedgerEventType::RewardRateChanged: return "RewardRateChanged";
        case LedgerEventType::PoolStatusChanged: return "PoolStatusChanged";
        case LedgerEventType::PoolLimitsChanged: return "PoolLimitsChanged";
        case LedgerEventType::RewardsFunded: return "RewardsFunded";
    }
    return "Unknown";
}

std::string Pool::ToString() const {
    std::ostringstream oss;
    oss << "Pool(id=" << id
        << ", stake=" << stakingAsset.symbol
        << ", reward=" << rewardAsset.symbol
        << ", rate=" << rewardRate
        << ", totalStaked=" << totalStaked
        << ", rpt=" << Uint128ToString(rewardPerTokenStored)
        << ", updated=" << lastUpdateTime
        << ", lockup=" << lockupPeriod
        << ", minStake=" << minStakeAmount
        << ", " << (active ? "active" : "inactive") << ")";
    return oss.str();
}

std::string LedgerEvent::ToString() const {
    std::ostringstream oss;
    oss << LedgerEventTypeToString(type) << "(pool=" << poolId
        << ", account=" << account.ToHex()
        << ", amount=" << amount;
    if (type == LedgerEventType::RewardRateChanged) {
        oss << ", previous=" << previous;
    }
    oss << ", t=" << time << ")";
    return oss.str();
}

} // namespace ledger
} // namespace stakeledger

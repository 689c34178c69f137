// StakeLedger - Staking Ledger Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/ledger.h"
#include "stakeledger/crypto/sha256.h"
#include "stakeledger/ledger/accrual.h"
#include "stakeledger/util/logging.h"

#include <algorithm>
#include <set>
#include <string>
#include <thread>

namespace stakeledger {
namespace ledger {

namespace {

// ============================================================================
// Pool Slot Guard
// ============================================================================

/// Pool slots held by the calling thread
thread_local size_t tls_heldSlots = 0;

/**
 * Locks a pool slot and marks the calling thread as its owner. A thread
 * that already holds any slot (a transfer calling back into the ledger)
 * locks nothing and Reentrant() is true, so no thread ever waits for a
 * pool while holding another one. Only Nested guards, taken by a snapshot
 * that locks every pool in id order, may be stacked.
 */
class SlotGuard {
public:
    enum Mode { Single, Nested };

    explicit SlotGuard(PoolSlot& slot, Mode mode = Single) : slot_(slot) {
        if (slot_.owner.load() == std::this_thread::get_id() ||
            (mode == Single && tls_heldSlots > 0)) {
            reentrant_ = true;
            return;
        }
        lock_ = std::unique_lock<std::mutex>(slot_.mutex);
        slot_.owner.store(std::this_thread::get_id());
        ++tls_heldSlots;
    }

    ~SlotGuard() {
        if (lock_.owns_lock()) {
            slot_.owner.store(std::thread::id());
            --tls_heldSlots;
        }
    }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

    bool Reentrant() const { return reentrant_; }

    /// True if the calling thread holds no pool slot
    static bool ThreadIsIdle() { return tls_heldSlots == 0; }

private:
    PoolSlot& slot_;
    std::unique_lock<std::mutex> lock_;
    bool reentrant_{false};
};

LedgerStatus ReentrantCall(PoolId poolId) {
    return LedgerStatus::State("reentrant call into pool " + std::to_string(poolId));
}

/// Log a rejected operation and hand the status back
LedgerStatus Reject(const char* operation, PoolId poolId, const LedgerStatus& status) {
    if (status.IsArithmetic()) {
        LOG_WARN(util::LogCategory::LEDGER) << operation << " pool " << poolId
                                            << " aborted: " << status.ToString();
    } else {
        LOG_DEBUG(util::LogCategory::LEDGER) << operation << " pool " << poolId
                                             << " rejected: " << status.ToString();
    }
    return status;
}

AccountId DeriveAccount(const char* tag, PoolId poolId) {
    Byte id[8];
    for (int i = 7; i >= 0; --i) {
        id[i] = static_cast<Byte>(poolId & 0xff);
        poolId >>= 8;
    }

    Byte digest[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.WriteField(tag).Write(id, sizeof(id)).Finalize(digest);
    return AccountId(digest, AccountId::SIZE);
}

} // namespace

// ============================================================================
// Validation Helpers
// ============================================================================

LedgerStatus ValidatePoolLimits(Duration lockupPeriod, Amount minStake) {
    if (lockupPeriod < 0) {
        return LedgerStatus::Validation("lockup period must not be negative");
    }
    if (minStake <= 0) {
        return LedgerStatus::Validation("minimum stake must be positive");
    }
    return LedgerStatus::Ok();
}

LedgerStatus ValidateSnapshot(const LedgerSnapshot& snapshot) {
    std::set<PoolId> seen;
    for (const auto& entry : snapshot.pools) {
        const Pool& pool = entry.pool;
        std::string where = "pool " + std::to_string(pool.id);

        if (pool.id < FIRST_POOL_ID) {
            return LedgerStatus::Validation("snapshot contains pool id 0");
        }
        if (!seen.insert(pool.id).second) {
            return LedgerStatus::Validation("duplicate " + where + " in snapshot");
        }
        if (pool.id >= snapshot.nextPoolId) {
            return LedgerStatus::Validation(where + " not below next pool id");
        }
        if (!pool.stakingAsset.IsValid() || !pool.rewardAsset.IsValid()) {
            return LedgerStatus::Validation(where + " has an invalid asset");
        }
        if (pool.rewardRate < 0 || pool.totalStaked < 0 || pool.totalRewardsPaid < 0) {
            return LedgerStatus::Validation(where + " has a negative amount");
        }

        Amount sum = 0;
        for (const auto& [account, position] : entry.positions) {
            if (position.amount < 0 || position.pendingRewards < 0) {
                return LedgerStatus::Validation(where + " has a negative position amount");
            }
            if (position.rewardPerTokenPaid > pool.rewardPerTokenStored) {
                return LedgerStatus::Validation(where + " has a position ahead of the pool accumulator");
            }
            auto next = CheckedAdd(sum, position.amount);
            if (!next) {
                return LedgerStatus::Arithmetic(where + " position total overflows");
            }
            sum = *next;
        }
        if (sum != pool.totalStaked) {
            return LedgerStatus::Validation(where + " totalStaked " + std::to_string(pool.totalStaked) +
                                            " != sum of positions " + std::to_string(sum));
        }
    }
    return LedgerStatus::Ok();
}

// ============================================================================
// StakingLedger
// ============================================================================

StakingLedger::StakingLedger(std::shared_ptr<AssetLedger> assets,
                             std::shared_ptr<AccessControl> access,
                             std::shared_ptr<Clock> clock)
    : assets_(std::move(assets))
    , access_(std::move(access))
    , clock_(std::move(clock)) {}

StakingLedger::~StakingLedger() = default;

AccountId StakingLedger::DeriveCustodyAccount(PoolId poolId) {
    return DeriveAccount("stakeledger/custody", poolId);
}

AccountId StakingLedger::DeriveRewardReserve(PoolId poolId) {
    return DeriveAccount("stakeledger/reward-reserve", poolId);
}

LedgerStatus StakingLedger::RequireAdmin(const AccountId& caller, const char* operation) const {
    if (!access_->HasRole(caller, roles::POOL_ADMIN)) {
        LOG_DEBUG(util::LogCategory::ADMIN) << operation << " denied for " << caller.ToHex();
        return LedgerStatus::Authorization(std::string(operation) + " requires the " +
                                           roles::POOL_ADMIN + " role");
    }
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::FindPool(PoolId poolId, PoolSlot** slot) const {
    *slot = pools_.Find(poolId);
    if (!*slot) {
        return LedgerStatus::Validation("unknown pool " + std::to_string(poolId));
    }
    return LedgerStatus::Ok();
}

Timestamp StakingLedger::EffectiveNow(const Pool& pool) const {
    return std::max(clock_->Now(), pool.lastUpdateTime);
}

void StakingLedger::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    eventCallback_ = std::move(callback);
}

void StakingLedger::Emit(const LedgerEvent& event) {
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = eventCallback_;
    }
    if (callback) {
        callback(event);
    }
}

// ============================================================================
// Administration
// ============================================================================

LedgerStatus StakingLedger::CreatePool(const AccountId& caller, const PoolParams& params,
                                       PoolId* poolId) {
    LedgerStatus s = RequireAdmin(caller, "CreatePool");
    if (!s.ok()) {
        return s;
    }
    if (!params.stakingAsset.IsValid() || !params.rewardAsset.IsValid()) {
        return Reject("CreatePool", 0, LedgerStatus::Validation("invalid asset id"));
    }
    if (params.rewardRate <= 0) {
        return Reject("CreatePool", 0, LedgerStatus::Validation("reward rate must be positive"));
    }
    s = ValidatePoolLimits(params.lockupPeriod, params.minStake);
    if (!s.ok()) {
        return Reject("CreatePool", 0, s);
    }

    Timestamp now = clock_->Now();

    Pool pool;
    pool.stakingAsset = params.stakingAsset;
    pool.rewardAsset = params.rewardAsset;
    pool.rewardRate = params.rewardRate;
    pool.lastUpdateTime = now;
    pool.rewardPerTokenStored = 0;
    pool.totalStaked = 0;
    pool.lockupPeriod = params.lockupPeriod;
    pool.minStakeAmount = params.minStake;
    pool.lockupPolicy = params.lockupPolicy;
    pool.active = true;
    pool.createdAt = now;

    PoolSlot* slot = pools_.Insert(pool, [](Pool& p) {
        p.custodyAccount = DeriveCustodyAccount(p.id);
        p.rewardReserve = DeriveRewardReserve(p.id);
    });
    PoolId id = slot->pool.id;

    LOG_INFO(util::LogCategory::ADMIN) << "Created pool " << id << " ("
                                       << params.stakingAsset.symbol << " -> "
                                       << params.rewardAsset.symbol << ", rate "
                                       << params.rewardRate << "/s, lockup "
                                       << params.lockupPeriod << "s, min stake "
                                       << params.minStake << ")";

    *poolId = id;

    LedgerEvent event;
    event.type = LedgerEventType::PoolCreated;
    event.poolId = id;
    event.account = caller;
    event.amount = params.rewardRate;
    event.time = now;
    Emit(event);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::SetRewardRate(const AccountId& caller, PoolId poolId, Amount newRate) {
    LedgerStatus s = RequireAdmin(caller, "SetRewardRate");
    if (!s.ok()) {
        return s;
    }
    if (newRate < 0) {
        return Reject("SetRewardRate", poolId,
                      LedgerStatus::Validation("reward rate must not be negative"));
    }

    PoolSlot* slot = nullptr;
    s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("SetRewardRate", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("SetRewardRate", poolId, ReentrantCall(poolId));
        }

        Pool pool = slot->pool;
        Timestamp now = EffectiveNow(pool);
        s = CheckpointPool(pool, now);
        if (!s.ok()) {
            return Reject("SetRewardRate", poolId, s);
        }

        Amount previous = pool.rewardRate;
        pool.rewardRate = newRate;
        slot->pool = pool;

        LOG_INFO(util::LogCategory::ADMIN) << "Pool " << poolId << " reward rate "
                                           << previous << " -> " << newRate << " at t=" << now;

        event.type = LedgerEventType::RewardRateChanged;
        event.poolId = poolId;
        event.account = caller;
        event.amount = newRate;
        event.previous = previous;
        event.time = now;
    }
    Emit(event);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::SetPoolActive(const AccountId& caller, PoolId poolId, bool active) {
    LedgerStatus s = RequireAdmin(caller, "SetPoolActive");
    if (!s.ok()) {
        return s;
    }

    PoolSlot* slot = nullptr;
    s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("SetPoolActive", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("SetPoolActive", poolId, ReentrantCall(poolId));
        }
        if (slot->pool.active == active) {
            return LedgerStatus::Ok();
        }

        slot->pool.active = active;
        LOG_INFO(util::LogCategory::ADMIN) << "Pool " << poolId
                                           << (active ? " activated" : " deactivated");

        event.type = LedgerEventType::PoolStatusChanged;
        event.poolId = poolId;
        event.account = caller;
        event.amount = active ? 1 : 0;
        event.time = EffectiveNow(slot->pool);
    }
    Emit(event);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::UpdatePoolLimits(const AccountId& caller, PoolId poolId,
                                             Duration lockupPeriod, Amount minStake) {
    LedgerStatus s = RequireAdmin(caller, "UpdatePoolLimits");
    if (!s.ok()) {
        return s;
    }
    s = ValidatePoolLimits(lockupPeriod, minStake);
    if (!s.ok()) {
        return Reject("UpdatePoolLimits", poolId, s);
    }

    PoolSlot* slot = nullptr;
    s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("UpdatePoolLimits", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("UpdatePoolLimits", poolId, ReentrantCall(poolId));
        }

        slot->pool.lockupPeriod = lockupPeriod;
        slot->pool.minStakeAmount = minStake;
        LOG_INFO(util::LogCategory::ADMIN) << "Pool " << poolId << " limits: lockup "
                                           << lockupPeriod << "s, min stake " << minStake;

        event.type = LedgerEventType::PoolLimitsChanged;
        event.poolId = poolId;
        event.account = caller;
        event.amount = minStake;
        event.time = EffectiveNow(slot->pool);
    }
    Emit(event);
    return LedgerStatus::Ok();
}

// ============================================================================
// Funding
// ============================================================================

LedgerStatus StakingLedger::FundRewards(const AccountId& funder, PoolId poolId, Amount amount) {
    if (amount <= 0) {
        return Reject("FundRewards", poolId,
                      LedgerStatus::Validation("funding amount must be positive"));
    }

    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("FundRewards", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("FundRewards", poolId, ReentrantCall(poolId));
        }

        const Pool& pool = slot->pool;
        TransferResult tr = assets_->Transfer(pool.rewardAsset, funder, pool.rewardReserve, amount);
        if (!tr.ok) {
            return Reject("FundRewards", poolId,
                          LedgerStatus::State("reward funding transfer failed: " + tr.error));
        }

        LOG_INFO(util::LogCategory::ADMIN) << "Pool " << poolId << " funded with " << amount
                                           << " " << pool.rewardAsset.symbol << " by "
                                           << funder.ToHex();

        event.type = LedgerEventType::RewardsFunded;
        event.poolId = poolId;
        event.account = funder;
        event.amount = amount;
        event.time = EffectiveNow(pool);
    }
    Emit(event);
    return LedgerStatus::Ok();
}

// ============================================================================
// Staking
// ============================================================================

LedgerStatus StakingLedger::Stake(PoolId poolId, const AccountId& account, Amount amount) {
    if (amount <= 0) {
        return Reject("Stake", poolId, LedgerStatus::Validation("stake amount must be positive"));
    }

    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("Stake", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("Stake", poolId, ReentrantCall(poolId));
        }

        Pool pool = slot->pool;
        if (!pool.active) {
            return Reject("Stake", poolId, LedgerStatus::State("pool is not active"));
        }
        if (amount < pool.minStakeAmount) {
            return Reject("Stake", poolId,
                          LedgerStatus::Validation("stake " + std::to_string(amount) +
                                                   " below minimum " +
                                                   std::to_string(pool.minStakeAmount)));
        }

        Timestamp now = EffectiveNow(pool);
        s = CheckpointPool(pool, now);
        if (!s.ok()) {
            return Reject("Stake", poolId, s);
        }

        const StakePosition* existing = slot->positions.Find(account);
        StakePosition position = existing ? *existing : StakePosition();
        s = CheckpointPosition(pool, position);
        if (!s.ok()) {
            return Reject("Stake", poolId, s);
        }

        auto newAmount = CheckedAdd(position.amount, amount);
        auto newTotal = CheckedAdd(pool.totalStaked, amount);
        if (!newAmount || !newTotal) {
            return Reject("Stake", poolId, LedgerStatus::Arithmetic("staked balance overflow"));
        }

        // A fresh or fully withdrawn position starts a new lockup window
        if (position.amount == 0 || pool.lockupPolicy == LockupPolicy::ResetOnTopUp) {
            position.stakingTime = now;
        }
        position.lastStakeTime = now;
        position.amount = *newAmount;
        position.active = true;
        pool.totalStaked = *newTotal;

        TransferResult tr = assets_->Transfer(pool.stakingAsset, account, pool.custodyAccount, amount);
        if (!tr.ok) {
            return Reject("Stake", poolId,
                          LedgerStatus::State("custody transfer failed: " + tr.error));
        }

        slot->pool = pool;
        slot->positions.Put(account, position);

        LOG_DEBUG(util::LogCategory::LEDGER) << "Stake pool " << poolId << " account "
                                             << account.ToHex() << " +" << amount
                                             << " -> " << position.amount << " (total "
                                             << pool.totalStaked << ")";

        event.type = LedgerEventType::Staked;
        event.poolId = poolId;
        event.account = account;
        event.amount = amount;
        event.time = now;
    }
    Emit(event);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::Withdraw(PoolId poolId, const AccountId& account, Amount amount) {
    if (amount <= 0) {
        return Reject("Withdraw", poolId,
                      LedgerStatus::Validation("withdraw amount must be positive"));
    }

    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("Withdraw", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("Withdraw", poolId, ReentrantCall(poolId));
        }

        const StakePosition* existing = slot->positions.Find(account);
        if (!existing || !existing->active || existing->amount == 0) {
            return Reject("Withdraw", poolId, LedgerStatus::State("no active position"));
        }
        if (amount > existing->amount) {
            return Reject("Withdraw", poolId,
                          LedgerStatus::State("withdraw " + std::to_string(amount) +
                                              " exceeds staked balance " +
                                              std::to_string(existing->amount)));
        }

        Pool pool = slot->pool;
        Timestamp now = EffectiveNow(pool);
        if (now - existing->stakingTime < pool.lockupPeriod) {
            return Reject("Withdraw", poolId,
                          LedgerStatus::State("lockup not elapsed; unlocks at " +
                                              std::to_string(existing->stakingTime +
                                                             pool.lockupPeriod)));
        }

        s = CheckpointPool(pool, now);
        if (!s.ok()) {
            return Reject("Withdraw", poolId, s);
        }
        StakePosition position = *existing;
        s = CheckpointPosition(pool, position);
        if (!s.ok()) {
            return Reject("Withdraw", poolId, s);
        }

        position.amount -= amount;
        pool.totalStaked -= amount;
        if (position.amount == 0) {
            position.active = false;
        }

        TransferResult tr = assets_->Transfer(pool.stakingAsset, pool.custodyAccount, account, amount);
        if (!tr.ok) {
            return Reject("Withdraw", poolId,
                          LedgerStatus::State("custody transfer failed: " + tr.error));
        }

        slot->pool = pool;
        slot->positions.Put(account, position);

        LOG_DEBUG(util::LogCategory::LEDGER) << "Withdraw pool " << poolId << " account "
                                             << account.ToHex() << " -" << amount
                                             << " -> " << position.amount << " (total "
                                             << pool.totalStaked << ")";

        event.type = LedgerEventType::Withdrawn;
        event.poolId = poolId;
        event.account = account;
        event.amount = amount;
        event.time = now;
    }
    Emit(event);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::ClaimReward(PoolId poolId, const AccountId& account, Amount* claimed) {
    *claimed = 0;

    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return Reject("ClaimReward", poolId, s);
    }

    LedgerEvent event;
    {
        SlotGuard guard(*slot);
        if (guard.Reentrant()) {
            return Reject("ClaimReward", poolId, ReentrantCall(poolId));
        }

        const StakePosition* existing = slot->positions.Find(account);
        if (!existing) {
            return LedgerStatus::Ok();
        }

        Pool pool = slot->pool;
        Timestamp now = EffectiveNow(pool);
        s = CheckpointPool(pool, now);
        if (!s.ok()) {
            return Reject("ClaimReward", poolId, s);
        }
        StakePosition position = *existing;
        s = CheckpointPosition(pool, position);
        if (!s.ok()) {
            return Reject("ClaimReward", poolId, s);
        }

        Amount payout = position.pendingRewards;
        if (payout == 0) {
            return LedgerStatus::Ok();
        }

        auto totalClaimed = CheckedAdd(position.totalClaimed, payout);
        auto totalPaid = CheckedAdd(pool.totalRewardsPaid, payout);
        if (!totalClaimed || !totalPaid) {
            return Reject("ClaimReward", poolId, LedgerStatus::Arithmetic("claimed total overflow"));
        }

        Amount reserve = assets_->BalanceOf(pool.rewardAsset, pool.rewardReserve);
        if (reserve < payout) {
            return Reject("ClaimReward", poolId,
                          LedgerStatus::State("reward reserve holds " + std::to_string(reserve) +
                                              ", claim needs " + std::to_string(payout)));
        }

        position.pendingRewards = 0;
        position.totalClaimed = *totalClaimed;
        pool.totalRewardsPaid = *totalPaid;

        TransferResult tr = assets_->Transfer(pool.rewardAsset, pool.rewardReserve, account, payout);
        if (!tr.ok) {
            return Reject("ClaimReward", poolId,
                          LedgerStatus::State("reward transfer failed: " + tr.error));
        }

        slot->pool = pool;
        slot->positions.Put(account, position);
        *claimed = payout;

        LOG_DEBUG(util::LogCategory::LEDGER) << "Claim pool " << poolId << " account "
                                             << account.ToHex() << " paid " << payout;

        event.type = LedgerEventType::RewardClaimed;
        event.poolId = poolId;
        event.account = account;
        event.amount = payout;
        event.time = now;
    }
    Emit(event);
    return LedgerStatus::Ok();
}

// ============================================================================
// Queries
// ============================================================================

LedgerStatus StakingLedger::Earned(PoolId poolId, const AccountId& account, Amount* earned) const {
    StakeInfo info;
    LedgerStatus s = GetStakeInfo(poolId, account, &info);
    if (s.ok()) {
        *earned = info.earned;
    }
    return s;
}

LedgerStatus StakingLedger::RewardPerToken(PoolId poolId, Uint128* rewardPerToken) const {
    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return s;
    }

    SlotGuard guard(*slot);
    if (guard.Reentrant()) {
        return ReentrantCall(poolId);
    }
    return ComputeRewardPerToken(slot->pool, EffectiveNow(slot->pool), rewardPerToken);
}

LedgerStatus StakingLedger::GetStakeInfo(PoolId poolId, const AccountId& account,
                                         StakeInfo* info) const {
    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return s;
    }

    SlotGuard guard(*slot);
    if (guard.Reentrant()) {
        return ReentrantCall(poolId);
    }

    StakeInfo result;
    result.poolId = poolId;
    result.account = account;

    const StakePosition* position = slot->positions.Find(account);
    if (position) {
        const Pool& pool = slot->pool;
        Uint128 rpt = 0;
        s = ComputeRewardPerToken(pool, EffectiveNow(pool), &rpt);
        if (!s.ok()) {
            return s;
        }
        s = ComputeEarned(*position, rpt, &result.earned);
        if (!s.ok()) {
            return s;
        }
        result.position = *position;
        result.state = position->State();
        auto unlock = CheckedAdd(position->stakingTime, pool.lockupPeriod);
        result.unlockTime = unlock ? *unlock : MAX_AMOUNT;
    }

    *info = result;
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::GetPositionState(PoolId poolId, const AccountId& account,
                                             PositionState* state) const {
    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return s;
    }

    SlotGuard guard(*slot);
    if (guard.Reentrant()) {
        return ReentrantCall(poolId);
    }
    const StakePosition* position = slot->positions.Find(account);
    *state = position ? position->State() : PositionState::Unstaked;
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::GetPool(PoolId poolId, Pool* pool) const {
    PoolSlot* slot = nullptr;
    LedgerStatus s = FindPool(poolId, &slot);
    if (!s.ok()) {
        return s;
    }

    SlotGuard guard(*slot);
    if (guard.Reentrant()) {
        return ReentrantCall(poolId);
    }
    *pool = slot->pool;
    return LedgerStatus::Ok();
}

std::vector<PoolId> StakingLedger::ListPoolIds() const {
    return pools_.Ids();
}

size_t StakingLedger::PoolCount() const {
    return pools_.Size();
}

// ============================================================================
// Snapshots
// ============================================================================

LedgerStatus StakingLedger::ExportSnapshot(LedgerSnapshot* snapshot) const {
    if (!SlotGuard::ThreadIsIdle()) {
        return LedgerStatus::State("snapshot export from inside a pool operation");
    }

    LedgerSnapshot result;
    std::vector<PoolSlot*> slots = pools_.Slots(&result.nextPoolId);

    // Lock every pool, in id order, so the copy is a single consistent cut
    std::vector<std::unique_ptr<SlotGuard>> guards;
    guards.reserve(slots.size());
    for (PoolSlot* slot : slots) {
        guards.push_back(std::make_unique<SlotGuard>(*slot, SlotGuard::Nested));
        if (guards.back()->Reentrant()) {
            return ReentrantCall(slot->pool.id);
        }
    }

    result.pools.reserve(slots.size());
    for (PoolSlot* slot : slots) {
        PoolSnapshot entry;
        entry.pool = slot->pool;
        entry.positions = slot->positions.All();
        result.pools.push_back(std::move(entry));
    }

    *snapshot = std::move(result);
    return LedgerStatus::Ok();
}

LedgerStatus StakingLedger::ImportSnapshot(const LedgerSnapshot& snapshot) {
    LedgerStatus s = ValidateSnapshot(snapshot);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Rejected snapshot: " << s.ToString();
        return s;
    }
    if (!pools_.Load(snapshot)) {
        return LedgerStatus::State("snapshot import requires an empty ledger");
    }

    size_t positions = 0;
    for (const auto& entry : snapshot.pools) {
        positions += entry.positions.size();
    }
    LOG_INFO(util::LogCategory::LEDGER) << "Imported " << snapshot.pools.size() << " pools, "
                                        << positions << " positions";
    return LedgerStatus::Ok();
}

} // namespace ledger
} // namespace stakeledger

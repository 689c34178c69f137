// StakeLedger - Pool and Position Stores
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/store.h"

namespace stakeledger {
namespace ledger {

// ============================================================================
// PositionStore
// ============================================================================

const StakePosition* PositionStore::Find(const AccountId& account) const {
    auto it = positions_.find(account);
    return it == positions_.end() ? nullptr : &it->second;
}

void PositionStore::Put(const AccountId& account, const StakePosition& position) {
    positions_[account] = position;
}

// ============================================================================
// PoolStore
// ============================================================================

PoolSlot* PoolStore::Find(PoolId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second.get();
}

PoolSlot* PoolStore::Insert(Pool pool, const std::function<void(Pool&)>& init) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pool.id = nextId_++;
    if (init) {
        init(pool);
    }
    auto slot = std::make_unique<PoolSlot>(pool);
    PoolSlot* raw = slot.get();
    slots_.emplace(pool.id, std::move(slot));
    return raw;
}

std::vector<PoolId> PoolStore::Ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PoolId> ids;
    ids.reserve(slots_.size());
    for (const auto& entry : slots_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<PoolSlot*> PoolStore::Slots(PoolId* nextId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (nextId) {
        *nextId = nextId_;
    }
    std::vector<PoolSlot*> out;
    out.reserve(slots_.size());
    for (const auto& entry : slots_) {
        out.push_back(entry.second.get());
    }
    return out;
}

size_t PoolStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.size();
}

bool PoolStore::Load(const LedgerSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!slots_.empty()) {
        return false;
    }

    PoolId next = snapshot.nextPoolId < FIRST_POOL_ID ? FIRST_POOL_ID : snapshot.nextPoolId;
    for (const auto& entry : snapshot.pools) {
        const Pool& pool = entry.pool;
        auto slot = std::make_unique<PoolSlot>(pool);
        for (const auto& [account, position] : entry.positions) {
            slot->positions.Put(account, position);
        }
        if (pool.id >= next) {
            next = pool.id + 1;
        }
        slots_[pool.id] = std::move(slot);
    }
    nextId_ = next;
    return true;
}

} // namespace ledger
} // namespace stakeledger

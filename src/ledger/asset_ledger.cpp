// StakeLedger - In-Memory Asset Ledger
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/asset_ledger.h"

namespace stakeledger {
namespace ledger {

TransferResult InMemoryAssetLedger::Transfer(const AssetId& asset,
                                             const AccountId& from,
                                             const AccountId& to,
                                             Amount amount) {
    if (!asset.IsValid()) {
        return TransferResult::Failure("invalid asset");
    }
    if (amount <= 0) {
        return TransferResult::Failure("transfer amount must be positive");
    }

    TransferHook hook;
    {
        std::lock_guard<std::mutex> lock(hookMutex_);
        hook = hook_;
    }
    if (hook) {
        TransferResult hooked = hook(asset, from, to, amount);
        if (!hooked.ok) {
            return hooked;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto fromIt = balances_.find({asset, from});
    Amount fromBalance = fromIt == balances_.end() ? 0 : fromIt->second;
    if (fromBalance < amount) {
        return TransferResult::Failure("insufficient " + asset.symbol + " balance");
    }
    if (from == to) {
        ++transferCount_;
        return TransferResult::Success();
    }

    Amount& toBalance = balances_[{asset, to}];
    auto credited = CheckedAdd(toBalance, amount);
    if (!credited) {
        return TransferResult::Failure("balance overflow");
    }
    toBalance = *credited;
    balances_[{asset, from}] = fromBalance - amount;
    ++transferCount_;
    return TransferResult::Success();
}

Amount InMemoryAssetLedger::BalanceOf(const AssetId& asset, const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({asset, account});
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryAssetLedger::Mint(const AssetId& asset, const AccountId& account, Amount amount) {
    if (!asset.IsValid() || amount <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& supply = supply_[asset];
    auto newSupply = CheckedAdd(supply, amount);
    if (!newSupply) {
        return false;
    }
    // Every balance is bounded by the supply, so this cannot overflow
    balances_[{asset, account}] += amount;
    supply = *newSupply;
    return true;
}

Amount InMemoryAssetLedger::TotalSupply(const AssetId& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supply_.find(asset);
    return it == supply_.end() ? 0 : it->second;
}

void InMemoryAssetLedger::SetTransferHook(TransferHook hook) {
    std::lock_guard<std::mutex> lock(hookMutex_);
    hook_ = std::move(hook);
}

size_t InMemoryAssetLedger::TransferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferCount_;
}

} // namespace ledger
} // namespace stakeledger

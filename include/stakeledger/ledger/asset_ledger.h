// StakeLedger - In-Memory Asset Ledger
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_ASSET_LEDGER_H
#define STAKELEDGER_LEDGER_ASSET_LEDGER_H

#include "stakeledger/ledger/interfaces.h"

#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace stakeledger {
namespace ledger {

/**
 * Reference AssetLedger keeping balances in memory.
 *
 * An optional transfer hook runs before each transfer with no internal
 * lock held. A failed hook result rejects the transfer; the hook may also
 * call back into other components.
 */
class InMemoryAssetLedger : public AssetLedger {
public:
    using TransferHook = std::function<TransferResult(const AssetId& asset,
                                                      const AccountId& from,
                                                      const AccountId& to,
                                                      Amount amount)>;

    InMemoryAssetLedger() = default;

    TransferResult Transfer(const AssetId& asset,
                            const AccountId& from,
                            const AccountId& to,
                            Amount amount) override;

    Amount BalanceOf(const AssetId& asset, const AccountId& account) const override;

    /// Create new units. Returns false on non-positive amount or overflow.
    bool Mint(const AssetId& asset, const AccountId& account, Amount amount);

    /// Sum of all balances of an asset
    Amount TotalSupply(const AssetId& asset) const;

    void SetTransferHook(TransferHook hook);

    size_t TransferCount() const;

private:
    using Key = std::pair<AssetId, AccountId>;

    mutable std::mutex mutex_;
    std::map<Key, Amount> balances_;
    std::map<AssetId, Amount> supply_;
    size_t transferCount_{0};

    std::mutex hookMutex_;
    TransferHook hook_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ASSET_LEDGER_H

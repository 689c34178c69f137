// StakeLedger - Collaborator Interfaces
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Services the ledger consumes but does not own: balances and transfers,
// and role checks.

#ifndef STAKELEDGER_LEDGER_INTERFACES_H
#define STAKELEDGER_LEDGER_INTERFACES_H

#include "stakeledger/core/types.h"

#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Asset Ledger
// ============================================================================

struct TransferResult {
    bool ok{false};
    std::string error;

    static TransferResult Success() { return {true, ""}; }
    static TransferResult Failure(const std::string& msg) { return {false, msg}; }
};

/**
 * Holds balances and moves assets between accounts.
 *
 * A failed Transfer must leave both balances unchanged.
 */
class AssetLedger {
public:
    virtual ~AssetLedger() = default;

    virtual TransferResult Transfer(const AssetId& asset,
                                    const AccountId& from,
                                    const AccountId& to,
                                    Amount amount) = 0;

    virtual Amount BalanceOf(const AssetId& asset, const AccountId& account) const = 0;
};

// ============================================================================
// Access Control
// ============================================================================

namespace roles {
    /// May create pools and change rate, limits and status
    constexpr const char* POOL_ADMIN = "pool-admin";
}

class AccessControl {
public:
    virtual ~AccessControl() = default;

    virtual bool HasRole(const AccountId& account, const std::string& role) const = 0;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_INTERFACES_H

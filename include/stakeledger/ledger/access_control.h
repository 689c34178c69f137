// StakeLedger - Role Registry
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_ACCESS_CONTROL_H
#define STAKELEDGER_LEDGER_ACCESS_CONTROL_H

#include "stakeledger/ledger/interfaces.h"

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace stakeledger {
namespace ledger {

/// Reference AccessControl: explicit (account, role) grants
class RoleRegistry : public AccessControl {
public:
    RoleRegistry() = default;

    /// Returns false if the grant already existed
    bool Grant(const AccountId& account, const std::string& role);

    /// Returns false if there was nothing to revoke
    bool Revoke(const AccountId& account, const std::string& role);

    bool HasRole(const AccountId& account, const std::string& role) const override;

    std::vector<AccountId> Members(const std::string& role) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::set<AccountId>> grants_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ACCESS_CONTROL_H

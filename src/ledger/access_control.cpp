// StakeLedger - Role Registry
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/access_control.h"
#include "stakeledger/util/logging.h"

#include <mutex>

namespace stakeledger {
namespace ledger {

bool RoleRegistry::Grant(const AccountId& account, const std::string& role) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool added = grants_[role].insert(account).second;
    if (added) {
        LOG_INFO(util::LogCategory::ADMIN) << "Granted role " << role << " to " << account.ToHex();
    }
    return added;
}

bool RoleRegistry::Revoke(const AccountId& account, const std::string& role) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = grants_.find(role);
    if (it == grants_.end() || it->second.erase(account) == 0) {
        return false;
    }
    LOG_INFO(util::LogCategory::ADMIN) << "Revoked role " << role << " from " << account.ToHex();
    return true;
}

bool RoleRegistry::HasRole(const AccountId& account, const std::string& role) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = grants_.find(role);
    return it != grants_.end() && it->second.count(account) > 0;
}

std::vector<AccountId> RoleRegistry::Members(const std::string& role) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = grants_.find(role);
    if (it == grants_.end()) {
        return {};
    }
    return std::vector<AccountId>(it->second.begin(), it->second.end());
}

} // namespace ledger
} // namespace stakeledger

// StakeLedger - Staking Service
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Request boundary in front of the staking ledger: idempotency keys for
// stake, withdraw and claim, role setup from configuration, and snapshot
// persistence through LedgerDB.

#ifndef STAKELEDGER_SERVICE_SERVICE_H
#define STAKELEDGER_SERVICE_SERVICE_H

#include "stakeledger/db/ledgerdb.h"
#include "stakeledger/ledger/access_control.h"
#include "stakeledger/ledger/ledger.h"
#include "stakeledger/service/config.h"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace stakeledger {
namespace service {

/// Outcome of a keyed request
struct OperationResult {
    ledger::LedgerStatus status;

    /// Claimed amount for ClaimReward, 0 otherwise
    Amount amount{0};

    /// True if the outcome was served from the idempotency cache
    bool replayed{false};

    bool ok() const { return status.ok(); }
};

/**
 * Owns a StakingLedger, its role registry and its database.
 *
 * Keyed requests: the first request with a given key executes and its
 * outcome is remembered (successes and validation/authorization
 * rejections). A later request with the same key and the same parameters
 * gets the remembered outcome; with different parameters it fails with a
 * ValidationError. An empty key disables deduplication for that call.
 */
class StakingService {
public:
    /**
     * Open storage at config.DatabasePath(), load the stored snapshot and
     * grant the configured admins. A null clock means SystemClock.
     */
    static std::pair<db::Status, std::unique_ptr<StakingService>> Open(
        const LedgerConfig& config,
        std::shared_ptr<ledger::AssetLedger> assets,
        std::shared_ptr<ledger::Clock> clock = nullptr);

    StakingService(const LedgerConfig& config,
                   std::shared_ptr<ledger::AssetLedger> assets,
                   std::shared_ptr<ledger::Clock> clock,
                   std::unique_ptr<db::LedgerDB> database);

    /// Flushes and closes
    ~StakingService();

    StakingService(const StakingService&) = delete;
    StakingService& operator=(const StakingService&) = delete;

    // === Keyed requests ===

    OperationResult Stake(const std::string& key, PoolId poolId,
                          const AccountId& account, Amount amount);

    OperationResult Withdraw(const std::string& key, PoolId poolId,
                             const AccountId& account, Amount amount);

    OperationResult ClaimReward(const std::string& key, PoolId poolId,
                                const AccountId& account);

    // === Administration ===

    /// CreatePool with the configured default limits
    ledger::LedgerStatus CreatePool(const AccountId& caller,
                                    const AssetId& stakingAsset,
                                    const AssetId& rewardAsset,
                                    Amount rewardRate,
                                    PoolId* poolId);

    // === Persistence ===

    /// Write the current ledger state to the database
    db::Status Flush();

    /// Flush and release the database; further Flush calls fail
    db::Status Close();

    bool IsOpen() const;

    // === Access ===

    ledger::StakingLedger& Ledger() { return *ledger_; }
    const ledger::StakingLedger& Ledger() const { return *ledger_; }

    ledger::RoleRegistry& Roles() { return *roles_; }

    const LedgerConfig& Config() const { return config_; }

    size_t CachedRequestCount() const;

private:
    struct CachedOutcome {
        Hash256 fingerprint;
        OperationResult result;
    };

    template<typename Func>
    OperationResult Execute(const char* operation, const std::string& key,
                            const Hash256& fingerprint, Func&& func);

    /// Whether an outcome may be replayed for a retried request
    static bool IsReplayable(const ledger::LedgerStatus& status);

    void Remember(const std::string& key, const CachedOutcome& outcome);

    LedgerConfig config_;
    std::shared_ptr<ledger::RoleRegistry> roles_;
    std::unique_ptr<ledger::StakingLedger> ledger_;

    mutable std::mutex dbMutex_;
    std::unique_ptr<db::LedgerDB> database_;

    mutable std::mutex cacheMutex_;
    std::map<std::string, CachedOutcome> outcomes_;
    std::deque<std::string> order_;
    std::set<std::string> inFlight_;
};

/// SHA-256 over the operation name and its parameters
Hash256 RequestFingerprint(const char* operation, PoolId poolId,
                           const AccountId& account, Amount amount);

} // namespace service
} // namespace stakeledger

#endif // STAKELEDGER_SERVICE_SERVICE_H

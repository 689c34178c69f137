// StakeLedger - Staking Service Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/service/service.h"
#include "stakeledger/crypto/sha256.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace service {

// ============================================================================
// Request Fingerprints
// ============================================================================

Hash256 RequestFingerprint(const char* operation, PoolId poolId,
                           const AccountId& account, Amount amount) {
    Byte digest[SHA256::OUTPUT_SIZE];
    SHA256 hasher;
    hasher.WriteField(operation)
          .WriteField(std::to_string(poolId))
          .WriteField(account.ToHex())
          .WriteField(std::to_string(amount))
          .Finalize(digest);
    return Hash256(digest, Hash256::SIZE);
}

// ============================================================================
// Construction
// ============================================================================

std::pair<db::Status, std::unique_ptr<StakingService>> StakingService::Open(
    const LedgerConfig& config,
    std::shared_ptr<ledger::AssetLedger> assets,
    std::shared_ptr<ledger::Clock> clock)
{
    db::Options options;
    options.backend = config.backend;
    options.block_cache_size = static_cast<size_t>(config.dbCache);

    auto [status, database] = db::LedgerDB::Open(config.DatabasePath(), options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::SERVICE) << "Cannot open ledger database: "
                                              << status.ToString();
        return {status, nullptr};
    }

    ledger::LedgerSnapshot snapshot;
    status = database->ReadSnapshot(&snapshot);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::SERVICE) << "Cannot read ledger state: "
                                              << status.ToString();
        return {status, nullptr};
    }

    if (!clock) {
        clock = std::make_shared<ledger::SystemClock>();
    }

    auto service = std::make_unique<StakingService>(config, std::move(assets),
                                                    std::move(clock), std::move(database));

    ledger::LedgerStatus imported = service->ledger_->ImportSnapshot(snapshot);
    if (!imported.ok()) {
        // Keep the stored state untouched on the way out
        service->database_.reset();
        return {db::Status::Corruption("stored ledger state rejected: " + imported.ToString()),
                nullptr};
    }

    LOG_INFO(util::LogCategory::SERVICE) << "Staking service open: " << snapshot.pools.size()
                                         << " pools, " << config.admins.size()
                                         << " admins, storage " << service->database_->BackendName();
    return {db::Status::Ok(), std::move(service)};
}

StakingService::StakingService(const LedgerConfig& config,
                               std::shared_ptr<ledger::AssetLedger> assets,
                               std::shared_ptr<ledger::Clock> clock,
                               std::unique_ptr<db::LedgerDB> database)
    : config_(config)
    , roles_(std::make_shared<ledger::RoleRegistry>())
    , database_(std::move(database))
{
    for (const auto& admin : config_.admins) {
        roles_->Grant(admin, ledger::roles::POOL_ADMIN);
    }
    ledger_ = std::make_unique<ledger::StakingLedger>(std::move(assets), roles_, std::move(clock));
}

StakingService::~StakingService() {
    db::Status s = Close();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::SERVICE) << "Final flush failed: " << s.ToString();
    }
}

// ============================================================================
// Keyed Requests
// ============================================================================

bool StakingService::IsReplayable(const ledger::LedgerStatus& status) {
    // State errors depend on time, balances and transfers; a retry may succeed
    return status.ok() || status.IsValidation() || status.IsAuthorization();
}

void StakingService::Remember(const std::string& key, const CachedOutcome& outcome) {
    outcomes_[key] = outcome;
    order_.push_back(key);
    while (order_.size() > config_.idempotencyCacheSize) {
        outcomes_.erase(order_.front());
        order_.pop_front();
    }
}

template<typename Func>
OperationResult StakingService::Execute(const char* operation, const std::string& key,
                                        const Hash256& fingerprint, Func&& func) {
    if (key.empty() || config_.idempotencyCacheSize == 0) {
        return func();
    }

    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = outcomes_.find(key);
        if (it != outcomes_.end()) {
            if (it->second.fingerprint != fingerprint) {
                LOG_WARN(util::LogCategory::SERVICE) << operation << ": idempotency key '" << key
                                                     << "' reused with different parameters";
                OperationResult result;
                result.status = ledger::LedgerStatus::Validation(
                    "idempotency key reused with different parameters");
                return result;
            }
            LOG_DEBUG(util::LogCategory::SERVICE) << operation << ": replaying outcome for key '"
                                                  << key << "'";
            OperationResult result = it->second.result;
            result.replayed = true;
            return result;
        }
        if (!inFlight_.insert(key).second) {
            OperationResult result;
            result.status = ledger::LedgerStatus::State(
                "request with this idempotency key is in progress");
            return result;
        }
    }

    OperationResult result;
    try {
        result = func();
    } catch (...) {
        // Release the key so a retry can run; the exception is the caller's
        std::lock_guard<std::mutex> lock(cacheMutex_);
        inFlight_.erase(key);
        throw;
    }

    std::lock_guard<std::mutex> lock(cacheMutex_);
    inFlight_.erase(key);
    if (IsReplayable(result.status)) {
        Remember(key, CachedOutcome{fingerprint, result});
    }
    return result;
}

OperationResult StakingService::Stake(const std::string& key, PoolId poolId,
                                      const AccountId& account, Amount amount) {
    return Execute("Stake", key, RequestFingerprint("stake", poolId, account, amount), [&]() {
        OperationResult result;
        result.status = ledger_->Stake(poolId, account, amount);
        return result;
    });
}

OperationResult StakingService::Withdraw(const std::string& key, PoolId poolId,
                                         const AccountId& account, Amount amount) {
    return Execute("Withdraw", key, RequestFingerprint("withdraw", poolId, account, amount), [&]() {
        OperationResult result;
        result.status = ledger_->Withdraw(poolId, account, amount);
        return result;
    });
}

OperationResult StakingService::ClaimReward(const std::string& key, PoolId poolId,
                                            const AccountId& account) {
    return Execute("ClaimReward", key, RequestFingerprint("claim", poolId, account, 0), [&]() {
        OperationResult result;
        result.status = ledger_->ClaimReward(poolId, account, &result.amount);
        return result;
    });
}

size_t StakingService::CachedRequestCount() const {
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return outcomes_.size();
}

// ============================================================================
// Administration
// ============================================================================

ledger::LedgerStatus StakingService::CreatePool(const AccountId& caller,
                                                const AssetId& stakingAsset,
                                                const AssetId& rewardAsset,
                                                Amount rewardRate,
                                                PoolId* poolId) {
    ledger::PoolParams params = config_.DefaultPoolParams();
    params.stakingAsset = stakingAsset;
    params.rewardAsset = rewardAsset;
    params.rewardRate = rewardRate;
    return ledger_->CreatePool(caller, params, poolId);
}

// ============================================================================
// Persistence
// ============================================================================

db::Status StakingService::Flush() {
    std::lock_guard<std::mutex> lock(dbMutex_);
    if (!database_) {
        return db::Status::IOError("service is closed");
    }

    ledger::LedgerSnapshot snapshot;
    ledger::LedgerStatus s = ledger_->ExportSnapshot(&snapshot);
    if (!s.ok()) {
        return db::Status::IOError("snapshot export failed: " + s.ToString());
    }
    return database_->WriteSnapshot(snapshot);
}

db::Status StakingService::Close() {
    if (!IsOpen()) {
        return db::Status::Ok();
    }

    db::Status s = Flush();

    std::lock_guard<std::mutex> lock(dbMutex_);
    database_.reset();
    LOG_INFO(util::LogCategory::SERVICE) << "Staking service closed";
    return s;
}

bool StakingService::IsOpen() const {
    std::lock_guard<std::mutex> lock(dbMutex_);
    return database_ != nullptr;
}

} // namespace service
} // namespace stakeledger

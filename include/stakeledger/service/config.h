// StakeLedger - Service Configuration
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Typed view of the configuration keys read by the ledger service.

#ifndef STAKELEDGER_SERVICE_CONFIG_H
#define STAKELEDGER_SERVICE_CONFIG_H

#include "stakeledger/core/types.h"
#include "stakeledger/db/database.h"
#include "stakeledger/ledger/types.h"
#include "stakeledger/util/config.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stakeledger {
namespace service {

// ============================================================================
// Defaults
// ============================================================================

namespace defaults {
    constexpr int64_t DB_CACHE = 8 * 1024 * 1024;
    constexpr int64_t IDEMPOTENCY_CACHE = 10000;
    constexpr const char* DB_DIRNAME = "ledger";
    constexpr const char* LOG_FILENAME = "stakeledger.log";
}

// ============================================================================
// LedgerConfig
// ============================================================================

struct LedgerConfig {
    std::filesystem::path dataDir;

    db::Backend backend{db::Backend::LevelDB};
    int64_t dbCache{defaults::DB_CACHE};

    std::string logLevel{"info"};
    /// Empty disables the file sink; relative paths live under dataDir
    std::string logFile;
    bool printToConsole{true};

    /// Remembered idempotency keys; 0 disables deduplication
    size_t idempotencyCacheSize{static_cast<size_t>(defaults::IDEMPOTENCY_CACHE)};

    /// Limits applied by DefaultPoolParams()
    Duration defaultLockup{0};
    Amount defaultMinStake{1};

    /// Accounts granted the pool-admin role on open
    std::vector<AccountId> admins;

    /**
     * Read and validate every service key. On failure out is left
     * untouched and the result names the offending key.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              LedgerConfig* out);

    /// dataDir/ledger
    std::filesystem::path DatabasePath() const;

    /// Pool parameters pre-filled with the configured limits
    ledger::PoolParams DefaultPoolParams() const;
};

/// Configure the global Logger from level, console and file settings
void SetupLogging(const LedgerConfig& config);

} // namespace service
} // namespace stakeledger

#endif // STAKELEDGER_SERVICE_CONFIG_H

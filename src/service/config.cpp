// StakeLedger - Service Configuration Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/service/config.h"
#include "stakeledger/util/logging.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace stakeledger {
namespace service {

namespace {

util::ConfigParseResult KeyError(const std::string& key, const std::string& problem) {
    return util::ConfigParseResult::Error("invalid value for '" + key + "': " + problem);
}

/// Reads an optional integer key; malformed values are an error
bool ReadInt(const util::ConfigManager& config, const char* key, const char* section,
             int64_t& value, util::ConfigParseResult& error) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto parsed = config.TryGetInt(key, section);
    std::string name = section[0] ? std::string(section) + "." + key : std::string(key);
    if (!parsed) {
        error = KeyError(name, "not an integer");
        return false;
    }
    value = *parsed;
    return true;
}

} // namespace

util::ConfigParseResult LedgerConfig::FromConfig(const util::ConfigManager& config,
                                                 LedgerConfig* out) {
    using util::ConfigKeys::ACCOUNT;
    using util::ConfigKeys::SECTION_ADMIN;
    using util::ConfigKeys::SECTION_POOL;

    LedgerConfig result;
    util::ConfigParseResult error;

    result.dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                    util::ConfigManager::GetDefaultDataDir());
    if (result.dataDir.empty()) {
        return KeyError(util::ConfigKeys::DATADIR, "empty path");
    }

    std::string backend = config.GetString(util::ConfigKeys::DB, "leveldb");
    std::transform(backend.begin(), backend.end(), backend.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (backend == "leveldb") {
        result.backend = db::Backend::LevelDB;
    } else if (backend == "memory") {
        result.backend = db::Backend::Memory;
    } else {
        return KeyError(util::ConfigKeys::DB, "expected leveldb or memory, got '" + backend + "'");
    }

    if (!ReadInt(config, util::ConfigKeys::DBCACHE, "", result.dbCache, error)) {
        return error;
    }
    if (result.dbCache < 0) {
        return KeyError(util::ConfigKeys::DBCACHE, "must not be negative");
    }

    result.logLevel = config.GetString(util::ConfigKeys::LOGLEVEL, result.logLevel);
    util::LogLevel level;
    if (!util::TryParseLogLevel(result.logLevel, level)) {
        return KeyError(util::ConfigKeys::LOGLEVEL, "unknown level '" + result.logLevel + "'");
    }

    result.logFile = config.GetPath(util::ConfigKeys::LOGFILE, "");
    result.printToConsole = config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true);

    int64_t cacheSize = defaults::IDEMPOTENCY_CACHE;
    if (!ReadInt(config, util::ConfigKeys::IDEMPOTENCYCACHE, "", cacheSize, error)) {
        return error;
    }
    if (cacheSize < 0) {
        return KeyError(util::ConfigKeys::IDEMPOTENCYCACHE, "must not be negative");
    }
    result.idempotencyCacheSize = static_cast<size_t>(cacheSize);

    if (!ReadInt(config, util::ConfigKeys::LOCKUP, SECTION_POOL, result.defaultLockup, error) ||
        !ReadInt(config, util::ConfigKeys::MINSTAKE, SECTION_POOL, result.defaultMinStake, error)) {
        return error;
    }
    if (result.defaultLockup < 0) {
        return KeyError("pool.lockup", "must not be negative");
    }
    if (result.defaultMinStake <= 0) {
        return KeyError("pool.minstake", "must be positive");
    }

    for (const auto& hex : config.GetList(ACCOUNT, SECTION_ADMIN)) {
        if (hex.size() != AccountId::SIZE * 2) {
            return KeyError("admin.account", "'" + hex + "' is not a 40-digit hex account id");
        }
        try {
            result.admins.push_back(AccountId::FromHex(hex));
        } catch (const std::invalid_argument& e) {
            return KeyError("admin.account", "'" + hex + "': " + e.what());
        }
    }

    *out = std::move(result);
    return util::ConfigParseResult::Success();
}

std::filesystem::path LedgerConfig::DatabasePath() const {
    return dataDir / defaults::DB_DIRNAME;
}

ledger::PoolParams LedgerConfig::DefaultPoolParams() const {
    ledger::PoolParams params;
    params.lockupPeriod = defaultLockup;
    params.minStake = defaultMinStake;
    return params;
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const LedgerConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();

    // Drop the default sink installed by Initialize()
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(config.logLevel);
    logger.SetLevel(level);

    if (config.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!config.logFile.empty()) {
        std::filesystem::path path(config.logFile);
        if (path.is_relative()) {
            path = config.dataDir / path;
        }

        util::FileSink::Config fileConfig;
        fileConfig.path = path.string();
        fileConfig.level = level;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_ERROR(util::LogCategory::CONFIG) << "Cannot open log file " << fileConfig.path;
        }
    }

    LOG_INFO(util::LogCategory::CONFIG) << "Logging at level " << util::LogLevelToString(level);
}

} // namespace service
} // namespace stakeledger

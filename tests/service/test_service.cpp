// StakeLedger - Staking Service Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/db/leveldb.h>
#include <stakeledger/ledger/asset_ledger.h>
#include <stakeledger/ledger/clock.h>
#include <stakeledger/service/config.h>
#include <stakeledger/service/service.h>
#include <stakeledger/util/config.h>

#include <array>
#include <filesystem>
#include <random>
#include <stdexcept>

using namespace stakeledger;
using namespace stakeledger::service;

namespace {

const AssetId STK("STK");
const AssetId RWD("RWD");

const char* ADMIN_HEX = "ad00000000000000000000000000000000000000";

AccountId Address(uint8_t id) {
    std::array<Byte, 20> data{};
    data[0] = id;
    return AccountId(data);
}

} // namespace

// ============================================================================
// LedgerConfig Tests
// ============================================================================

class LedgerConfigTest : public ::testing::Test {
protected:
    util::ConfigParseResult Parse(const std::string& text, LedgerConfig* out) {
        util::ConfigManager config;
        util::ConfigParseResult parsed = config.ParseString(text);
        EXPECT_TRUE(parsed.success) << parsed.ToString();
        return LedgerConfig::FromConfig(config, out);
    }
};

TEST_F(LedgerConfigTest, Defaults) {
    LedgerConfig config;
    ASSERT_TRUE(Parse("datadir=/tmp/sl\n", &config).success);
    EXPECT_EQ(config.dataDir, std::filesystem::path("/tmp/sl"));
    EXPECT_EQ(config.DatabasePath(), std::filesystem::path("/tmp/sl/ledger"));
    EXPECT_EQ(config.backend, db::Backend::LevelDB);
    EXPECT_EQ(config.dbCache, defaults::DB_CACHE);
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.printToConsole);
    EXPECT_EQ(config.idempotencyCacheSize, 10000u);
    EXPECT_EQ(config.defaultLockup, 0);
    EXPECT_EQ(config.defaultMinStake, 1);
    EXPECT_TRUE(config.admins.empty());
}

TEST_F(LedgerConfigTest, ReadsEveryKey) {
    LedgerConfig config;
    util::ConfigParseResult r = Parse(
        "datadir=/var/lib/sl\n"
        "db=memory\n"
        "dbcache=16m\n"
        "loglevel=debug\n"
        "logfile=ledger.log\n"
        "printtoconsole=0\n"
        "idempotencycache=50\n"
        "[pool]\n"
        "lockup=3600\n"
        "minstake=25\n"
        "[admin]\n"
        "account=" + std::string(ADMIN_HEX) + "\n"
        "account=0000000000000000000000000000000000000001\n",
        &config);
    ASSERT_TRUE(r.success) << r.ToString();

    EXPECT_EQ(config.backend, db::Backend::Memory);
    EXPECT_EQ(config.dbCache, 16 * 1024 * 1024);
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.logFile, "ledger.log");
    EXPECT_FALSE(config.printToConsole);
    EXPECT_EQ(config.idempotencyCacheSize, 50u);

    ledger::PoolParams params = config.DefaultPoolParams();
    EXPECT_EQ(params.lockupPeriod, 3600);
    EXPECT_EQ(params.minStake, 25);

    ASSERT_EQ(config.admins.size(), 2u);
    EXPECT_EQ(config.admins[0], Address(0xAD));
}

TEST_F(LedgerConfigTest, RejectsBadValues) {
    const char* bad[] = {
        "db=rocksdb\n",
        "dbcache=-1\n",
        "dbcache=lots\n",
        "loglevel=chatty\n",
        "idempotencycache=-5\n",
        "[pool]\nlockup=-1\n",
        "[pool]\nminstake=0\n",
        "[admin]\naccount=1234\n",
        "[admin]\naccount=zz00000000000000000000000000000000000000\n",
    };
    for (const char* text : bad) {
        LedgerConfig config;
        config.logLevel = "untouched";
        util::ConfigParseResult r = Parse(std::string("datadir=/tmp/sl\n") + text, &config);
        EXPECT_FALSE(r.success) << text;
        EXPECT_FALSE(r.errorMessage.empty()) << text;
        EXPECT_EQ(config.logLevel, "untouched") << text;
    }
}

// ============================================================================
// StakingService Tests
// ============================================================================

class StakingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dataDir_ = std::filesystem::temp_directory_path() /
                   ("stakeledger_service_" + std::to_string(rd()));

        config_.dataDir = dataDir_;
        config_.backend = db::Backend::Memory;
        config_.printToConsole = false;
        config_.idempotencyCacheSize = 3;
        config_.admins.push_back(Address(0xAD));

        assets_ = std::make_shared<ledger::InMemoryAssetLedger>();
        clock_ = std::make_shared<ledger::ManualClock>(1000);
        assets_->Mint(STK, Address(1), 10000);
        assets_->Mint(RWD, Address(0xAD), 1000000);
    }

    void TearDown() override {
        service_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dataDir_, ec);
    }

    void OpenService() {
        auto [status, service] = StakingService::Open(config_, assets_, clock_);
        ASSERT_TRUE(status.ok()) << status.ToString();
        service_ = std::move(service);
    }

    PoolId NewPool() {
        PoolId id = 0;
        EXPECT_TRUE(service_->CreatePool(Address(0xAD), STK, RWD, 10, &id).ok());
        EXPECT_TRUE(service_->Ledger().FundRewards(Address(0xAD), id, 100000).ok());
        return id;
    }

    std::filesystem::path dataDir_;
    LedgerConfig config_;
    std::shared_ptr<ledger::InMemoryAssetLedger> assets_;
    std::shared_ptr<ledger::ManualClock> clock_;
    std::unique_ptr<StakingService> service_;
};

TEST_F(StakingServiceTest, ConfiguredAdminsCanCreatePools) {
    OpenService();
    EXPECT_TRUE(service_->IsOpen());
    EXPECT_TRUE(service_->Roles().HasRole(Address(0xAD), ledger::roles::POOL_ADMIN));
    EXPECT_FALSE(service_->Roles().HasRole(Address(1), ledger::roles::POOL_ADMIN));

    PoolId id = 0;
    EXPECT_TRUE(service_->CreatePool(Address(1), STK, RWD, 10, &id).IsAuthorization());
    ASSERT_TRUE(service_->CreatePool(Address(0xAD), STK, RWD, 10, &id).ok());
    EXPECT_EQ(id, 1u);
}

TEST_F(StakingServiceTest, PoolsUseConfiguredLimits) {
    config_.defaultLockup = 30;
    config_.defaultMinStake = 10;
    OpenService();
    PoolId id = NewPool();

    ledger::Pool pool;
    ASSERT_TRUE(service_->Ledger().GetPool(id, &pool).ok());
    EXPECT_EQ(pool.lockupPeriod, 30);
    EXPECT_EQ(pool.minStakeAmount, 10);
}

TEST_F(StakingServiceTest, RetriedStakeIsAppliedOnce) {
    OpenService();
    PoolId id = NewPool();

    OperationResult first = service_->Stake("req-1", id, Address(1), 100);
    ASSERT_TRUE(first.ok()) << first.status.ToString();
    EXPECT_FALSE(first.replayed);

    OperationResult retry = service_->Stake("req-1", id, Address(1), 100);
    EXPECT_TRUE(retry.ok());
    EXPECT_TRUE(retry.replayed);

    ledger::Pool pool;
    ASSERT_TRUE(service_->Ledger().GetPool(id, &pool).ok());
    EXPECT_EQ(pool.totalStaked, 100);
    EXPECT_EQ(assets_->BalanceOf(STK, Address(1)), 9900);
}

TEST_F(StakingServiceTest, ThrowingTransferReleasesKey) {
    OpenService();
    PoolId id = NewPool();

    assets_->SetTransferHook([](const AssetId&, const AccountId&, const AccountId&, Amount)
                                 -> ledger::TransferResult {
        throw std::runtime_error("custody backend unavailable");
    });
    EXPECT_THROW(service_->Stake("req-1", id, Address(1), 100), std::runtime_error);
    assets_->SetTransferHook(nullptr);

    OperationResult retry = service_->Stake("req-1", id, Address(1), 100);
    ASSERT_TRUE(retry.ok()) << retry.status.ToString();
    EXPECT_FALSE(retry.replayed);

    ledger::Pool pool;
    ASSERT_TRUE(service_->Ledger().GetPool(id, &pool).ok());
    EXPECT_EQ(pool.totalStaked, 100);
    EXPECT_EQ(assets_->BalanceOf(STK, Address(1)), 9900);
}

TEST_F(StakingServiceTest, KeyReuseWithOtherParametersIsRejected) {
    OpenService();
    PoolId id = NewPool();

    ASSERT_TRUE(service_->Stake("req-1", id, Address(1), 100).ok());
    OperationResult reused = service_->Stake("req-1", id, Address(1), 200);
    EXPECT_TRUE(reused.status.IsValidation());
    EXPECT_FALSE(reused.replayed);

    OperationResult otherOp = service_->Withdraw("req-1", id, Address(1), 100);
    EXPECT_TRUE(otherOp.status.IsValidation());
}

TEST_F(StakingServiceTest, ClaimReplayReturnsSameAmount) {
    OpenService();
    PoolId id = NewPool();
    ASSERT_TRUE(service_->Stake("", id, Address(1), 100).ok());
    clock_->Advance(10);

    OperationResult claim = service_->ClaimReward("claim-1", id, Address(1));
    ASSERT_TRUE(claim.ok());
    EXPECT_EQ(claim.amount, 100);

    clock_->Advance(10);
    OperationResult retry = service_->ClaimReward("claim-1", id, Address(1));
    EXPECT_TRUE(retry.replayed);
    EXPECT_EQ(retry.amount, 100);
    EXPECT_EQ(assets_->BalanceOf(RWD, Address(1)), 100);
}

TEST_F(StakingServiceTest, StateErrorsAreRetryable) {
    config_.defaultLockup = 50;
    OpenService();
    PoolId id = NewPool();
    ASSERT_TRUE(service_->Stake("", id, Address(1), 100).ok());

    OperationResult early = service_->Withdraw("w-1", id, Address(1), 100);
    EXPECT_TRUE(early.status.IsState());
    EXPECT_EQ(service_->CachedRequestCount(), 0u);

    clock_->Advance(50);
    OperationResult later = service_->Withdraw("w-1", id, Address(1), 100);
    EXPECT_TRUE(later.ok()) << later.status.ToString();
    EXPECT_FALSE(later.replayed);
}

TEST_F(StakingServiceTest, ValidationErrorsAreRemembered) {
    OpenService();
    PoolId id = NewPool();

    OperationResult bad = service_->Stake("s-1", id, Address(1), 0);
    EXPECT_TRUE(bad.status.IsValidation());
    OperationResult again = service_->Stake("s-1", id, Address(1), 0);
    EXPECT_TRUE(again.status.IsValidation());
    EXPECT_TRUE(again.replayed);
}

TEST_F(StakingServiceTest, OldestKeysAreEvicted) {
    OpenService();
    PoolId id = NewPool();

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(service_->Stake("k" + std::to_string(i), id, Address(1), 10).ok());
    }
    EXPECT_EQ(service_->CachedRequestCount(), 3u);

    // k0 was evicted: the request runs again
    OperationResult rerun = service_->Stake("k0", id, Address(1), 10);
    EXPECT_FALSE(rerun.replayed);
    EXPECT_TRUE(service_->Stake("k3", id, Address(1), 10).replayed);

    ledger::Pool pool;
    ASSERT_TRUE(service_->Ledger().GetPool(id, &pool).ok());
    EXPECT_EQ(pool.totalStaked, 50);
}

TEST_F(StakingServiceTest, EmptyKeyAlwaysExecutes) {
    OpenService();
    PoolId id = NewPool();
    ASSERT_TRUE(service_->Stake("", id, Address(1), 10).ok());
    ASSERT_TRUE(service_->Stake("", id, Address(1), 10).ok());
    EXPECT_EQ(service_->CachedRequestCount(), 0u);
    EXPECT_EQ(assets_->BalanceOf(STK, Address(1)), 9980);
}

TEST_F(StakingServiceTest, CloseStopsFlushing) {
    OpenService();
    NewPool();
    EXPECT_TRUE(service_->Flush().ok());
    EXPECT_TRUE(service_->Close().ok());
    EXPECT_FALSE(service_->IsOpen());
    EXPECT_TRUE(service_->Flush().IsIOError());
    EXPECT_TRUE(service_->Close().ok());
}

TEST_F(StakingServiceTest, RestoresStateFromDatabase) {
    if (!db::HaveLevelDB()) {
        GTEST_SKIP() << "built without LevelDB";
    }
    config_.backend = db::Backend::LevelDB;
    OpenService();
    PoolId id = NewPool();
    ASSERT_TRUE(service_->Stake("", id, Address(1), 100).ok());
    clock_->Advance(10);
    ASSERT_TRUE(service_->Close().ok());
    service_.reset();

    OpenService();
    Amount earned = 0;
    ASSERT_TRUE(service_->Ledger().Earned(id, Address(1), &earned).ok());
    EXPECT_EQ(earned, 100);
    EXPECT_EQ(service_->Ledger().PoolCount(), 1u);
}

TEST_F(StakingServiceTest, StoredPoolsAreKeyedById) {
    auto memory = std::make_unique<db::MemoryDatabase>();
    db::MemoryDatabase* raw = memory.get();
    db::LedgerDB database(std::move(memory));

    ledger::LedgerSnapshot snapshot;
    ledger::PoolSnapshot entry;
    entry.pool.id = 1;
    entry.pool.stakingAsset = STK;
    entry.pool.rewardAsset = RWD;
    entry.pool.rewardRate = 1;
    snapshot.pools.push_back(entry);
    snapshot.pools.push_back(entry);   // duplicate id
    snapshot.nextPoolId = 2;
    ASSERT_TRUE(database.WriteSnapshot(snapshot).ok());

    ledger::LedgerSnapshot loaded;
    ASSERT_TRUE(database.ReadSnapshot(&loaded).ok());
    EXPECT_EQ(loaded.pools.size(), 1u);   // one key per pool id
    EXPECT_TRUE(raw->Exists(db::PoolKey(1)));

    ledger::StakingLedger fresh(assets_, std::make_shared<ledger::RoleRegistry>(), clock_);
    EXPECT_TRUE(fresh.ImportSnapshot(snapshot).IsValidation());
    EXPECT_TRUE(fresh.ImportSnapshot(loaded).ok());
}

TEST(RequestFingerprintTest, CoversEveryParameter) {
    Hash256 base = RequestFingerprint("stake", 1, Address(1), 10);
    EXPECT_EQ(base, RequestFingerprint("stake", 1, Address(1), 10));
    EXPECT_NE(base, RequestFingerprint("withdraw", 1, Address(1), 10));
    EXPECT_NE(base, RequestFingerprint("stake", 2, Address(1), 10));
    EXPECT_NE(base, RequestFingerprint("stake", 1, Address(2), 10));
    EXPECT_NE(base, RequestFingerprint("stake", 1, Address(1), 11));
}

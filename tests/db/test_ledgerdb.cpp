// StakeLedger - Ledger Database Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/db/ledgerdb.h"
#include "stakeledger/db/leveldb.h"

#include <array>
#include <filesystem>
#include <random>

using namespace stakeledger;
using namespace stakeledger::db;

// ============================================================================
// Test Utilities
// ============================================================================

class LedgerDBTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto memory = std::make_unique<MemoryDatabase>();
        raw_ = memory.get();
        db_ = std::make_unique<LedgerDB>(std::move(memory));
    }

    static AccountId Address(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        return AccountId(data);
    }

    static ledger::PoolSnapshot MakePool(PoolId id, std::initializer_list<Amount> stakes) {
        ledger::PoolSnapshot entry;
        entry.pool.id = id;
        entry.pool.stakingAsset = AssetId("STK");
        entry.pool.rewardAsset = AssetId("RWD");
        entry.pool.rewardRate = 10;
        entry.pool.rewardPerTokenStored = static_cast<Uint128>(3) * ledger::PRECISION;
        entry.pool.lastUpdateTime = 5000;
        entry.pool.lockupPeriod = 60;
        entry.pool.lockupPolicy = ledger::LockupPolicy::ResetOnTopUp;

        uint8_t n = 1;
        for (Amount amount : stakes) {
            ledger::StakePosition position;
            position.amount = amount;
            position.active = amount > 0;
            position.rewardPerTokenPaid = ledger::PRECISION;
            position.pendingRewards = 7;
            position.stakingTime = 4000;
            position.lastStakeTime = 4500;
            entry.positions.emplace(Address(n++), position);
            entry.pool.totalStaked += amount;
        }
        return entry;
    }

    MemoryDatabase* raw_{nullptr};
    std::unique_ptr<LedgerDB> db_;
};

// ============================================================================
// Key Layout
// ============================================================================

TEST(LedgerKeyTest, PoolKeysSortById) {
    std::string key = PoolKey(0x0102);
    ASSERT_EQ(key.size(), 9u);
    EXPECT_EQ(key[0], prefix::POOL);
    EXPECT_EQ(key[7], 0x01);
    EXPECT_EQ(key[8], 0x02);
    EXPECT_LT(PoolKey(255), PoolKey(256));
}

TEST(LedgerKeyTest, PositionKeysGroupByPool) {
    std::array<Byte, 20> data{};
    data.fill(0xff);
    std::string a = PositionKey(1, AccountId(data));
    std::string b = PositionKey(2, AccountId());
    ASSERT_EQ(a.size(), 29u);
    EXPECT_EQ(a[0], prefix::POSITION);
    EXPECT_LT(a, b);
    EXPECT_EQ(MetaKey("nextpool"), "Mnextpool");
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(LedgerDBTest, EmptyDatabase) {
    EXPECT_TRUE(db_->IsEmpty());
    ledger::LedgerSnapshot snapshot;
    snapshot.nextPoolId = 99;
    ASSERT_TRUE(db_->ReadSnapshot(&snapshot).ok());
    EXPECT_TRUE(snapshot.pools.empty());
    EXPECT_EQ(snapshot.nextPoolId, 1u);
    EXPECT_STREQ(db_->BackendName(), "memory");
}

TEST_F(LedgerDBTest, WriteAndReadSnapshot) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(1, {100, 250}));
    snapshot.pools.push_back(MakePool(3, {}));
    snapshot.nextPoolId = 4;

    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());
    EXPECT_FALSE(db_->IsEmpty());
    EXPECT_EQ(db_->GetWriteCount(), 1u);

    ledger::LedgerSnapshot loaded;
    Status s = db_->ReadSnapshot(&loaded);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_EQ(loaded.nextPoolId, 4u);
    ASSERT_EQ(loaded.pools.size(), 2u);

    const auto& first = loaded.pools[0];
    EXPECT_EQ(first.pool.id, 1u);
    EXPECT_EQ(first.pool.totalStaked, 350);
    EXPECT_TRUE(first.pool.rewardPerTokenStored == 3 * ledger::PRECISION);
    EXPECT_EQ(first.pool.lockupPolicy, ledger::LockupPolicy::ResetOnTopUp);
    EXPECT_EQ(first.pool.stakingAsset, AssetId("STK"));
    ASSERT_EQ(first.positions.size(), 2u);

    const auto& position = first.positions.at(Address(2));
    EXPECT_EQ(position.amount, 250);
    EXPECT_EQ(position.pendingRewards, 7);
    EXPECT_EQ(position.stakingTime, 4000);
    EXPECT_EQ(position.lastStakeTime, 4500);
    EXPECT_TRUE(position.active);

    EXPECT_EQ(loaded.pools[1].pool.id, 3u);
    EXPECT_TRUE(loaded.pools[1].positions.empty());
}

TEST_F(LedgerDBTest, PointLookups) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(2, {40}));
    snapshot.nextPoolId = 3;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot, false).ok());

    ledger::Pool pool;
    ASSERT_TRUE(db_->ReadPool(2, &pool).ok());
    EXPECT_EQ(pool.totalStaked, 40);
    EXPECT_TRUE(db_->ReadPool(1, &pool).IsNotFound());

    ledger::StakePosition position;
    ASSERT_TRUE(db_->ReadPosition(2, Address(1), &position).ok());
    EXPECT_EQ(position.amount, 40);
    EXPECT_TRUE(db_->ReadPosition(2, Address(9), &position).IsNotFound());
}

TEST_F(LedgerDBTest, RewriteDropsStaleRecords) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(1, {10, 20, 30}));
    snapshot.pools.push_back(MakePool(2, {5}));
    snapshot.nextPoolId = 3;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());

    snapshot.pools.pop_back();
    snapshot.pools[0] = MakePool(1, {10});
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());

    EXPECT_FALSE(raw_->Exists(PoolKey(2)));
    EXPECT_FALSE(raw_->Exists(PositionKey(1, Address(3))));
    EXPECT_TRUE(raw_->Exists(PositionKey(1, Address(1))));

    ledger::LedgerSnapshot loaded;
    ASSERT_TRUE(db_->ReadSnapshot(&loaded).ok());
    ASSERT_EQ(loaded.pools.size(), 1u);
    EXPECT_EQ(loaded.pools[0].positions.size(), 1u);
    EXPECT_EQ(loaded.nextPoolId, 3u);
}

// ============================================================================
// Corruption Detection
// ============================================================================

TEST_F(LedgerDBTest, DetectsTotalMismatch) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(1, {10, 20}));
    snapshot.nextPoolId = 2;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());

    ASSERT_TRUE(raw_->Delete(PositionKey(1, Address(2))).ok());

    ledger::LedgerSnapshot loaded;
    EXPECT_TRUE(db_->ReadSnapshot(&loaded).IsCorruption());
}

TEST_F(LedgerDBTest, DetectsMisfiledPool) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(1, {}));
    snapshot.nextPoolId = 5;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());

    ledger::Pool pool = MakePool(3, {}).pool;
    ASSERT_TRUE(raw_->Put(PoolKey(4), SerializeToString(pool)).ok());

    ledger::LedgerSnapshot loaded;
    EXPECT_TRUE(db_->ReadSnapshot(&loaded).IsCorruption());
}

TEST_F(LedgerDBTest, DetectsOrphanPosition) {
    ledger::LedgerSnapshot snapshot;
    snapshot.pools.push_back(MakePool(1, {}));
    snapshot.nextPoolId = 2;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());

    ledger::StakePosition position;
    position.amount = 1;
    ASSERT_TRUE(raw_->Put(PositionKey(7, Address(1)), SerializeToString(position)).ok());

    ledger::LedgerSnapshot loaded;
    EXPECT_TRUE(db_->ReadSnapshot(&loaded).IsCorruption());
}

TEST_F(LedgerDBTest, RejectsUnknownSchemaVersion) {
    ledger::LedgerSnapshot snapshot;
    snapshot.nextPoolId = 1;
    ASSERT_TRUE(db_->WriteSnapshot(snapshot).ok());
    ASSERT_TRUE(raw_->Put(std::string(1, prefix::VERSION),
                          SerializeToString(LEDGER_SCHEMA_VERSION + 1)).ok());

    ledger::LedgerSnapshot loaded;
    EXPECT_TRUE(db_->ReadSnapshot(&loaded).IsNotSupported());
}

// ============================================================================
// On-disk Round Trip
// ============================================================================

TEST(LedgerDBDiskTest, ReopenKeepsState) {
    if (!HaveLevelDB()) {
        GTEST_SKIP() << "built without LevelDB";
    }

    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("stakeledger_ledgerdb_" + std::to_string(rd()));

    ledger::LedgerSnapshot snapshot;
    ledger::PoolSnapshot entry;
    entry.pool.id = 1;
    entry.pool.stakingAsset = AssetId("STK");
    entry.pool.rewardAsset = AssetId("RWD");
    entry.pool.rewardRate = 1;
    snapshot.pools.push_back(entry);
    snapshot.nextPoolId = 2;

    {
        auto [status, db] = LedgerDB::Open(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(db->WriteSnapshot(snapshot).ok());
    }
    {
        auto [status, db] = LedgerDB::Open(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ledger::LedgerSnapshot loaded;
        ASSERT_TRUE(db->ReadSnapshot(&loaded).ok());
        ASSERT_EQ(loaded.pools.size(), 1u);
        EXPECT_EQ(loaded.nextPoolId, 2u);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

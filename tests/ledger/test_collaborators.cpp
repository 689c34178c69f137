// StakeLedger - Collaborator and Record Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/ledger/access_control.h>
#include <stakeledger/ledger/asset_ledger.h>
#include <stakeledger/ledger/clock.h>
#include <stakeledger/ledger/ledger.h>
#include <stakeledger/ledger/status.h>
#include <stakeledger/ledger/types.h>
#include <stakeledger/util/time.h>

#include <array>
#include <string>

using namespace stakeledger;
using namespace stakeledger::ledger;

namespace {

const AssetId STK("STK");

AccountId Address(uint8_t id) {
    std::array<Byte, 20> data{};
    data[19] = id;
    return AccountId(data);
}

} // namespace

// ============================================================================
// InMemoryAssetLedger Tests
// ============================================================================

TEST(AssetLedgerTest, MintAndTransfer) {
    InMemoryAssetLedger assets;
    ASSERT_TRUE(assets.Mint(STK, Address(1), 500));
    EXPECT_EQ(assets.BalanceOf(STK, Address(1)), 500);
    EXPECT_EQ(assets.TotalSupply(STK), 500);

    TransferResult r = assets.Transfer(STK, Address(1), Address(2), 200);
    ASSERT_TRUE(r.ok) << r.error;
    EXPECT_EQ(assets.BalanceOf(STK, Address(1)), 300);
    EXPECT_EQ(assets.BalanceOf(STK, Address(2)), 200);
    EXPECT_EQ(assets.TotalSupply(STK), 500);
    EXPECT_EQ(assets.TransferCount(), 1u);
}

TEST(AssetLedgerTest, MintRejectsBadInput) {
    InMemoryAssetLedger assets;
    EXPECT_FALSE(assets.Mint(STK, Address(1), 0));
    EXPECT_FALSE(assets.Mint(AssetId(""), Address(1), 5));
    ASSERT_TRUE(assets.Mint(STK, Address(1), MAX_AMOUNT));
    EXPECT_FALSE(assets.Mint(STK, Address(2), 1));
    EXPECT_EQ(assets.BalanceOf(STK, Address(2)), 0);
}

TEST(AssetLedgerTest, FailedTransferLeavesBalances) {
    InMemoryAssetLedger assets;
    ASSERT_TRUE(assets.Mint(STK, Address(1), 100));

    EXPECT_FALSE(assets.Transfer(STK, Address(1), Address(2), 101).ok);
    EXPECT_FALSE(assets.Transfer(STK, Address(1), Address(2), 0).ok);
    EXPECT_FALSE(assets.Transfer(AssetId("RWD"), Address(1), Address(2), 1).ok);

    EXPECT_EQ(assets.BalanceOf(STK, Address(1)), 100);
    EXPECT_EQ(assets.BalanceOf(STK, Address(2)), 0);
    EXPECT_EQ(assets.TransferCount(), 0u);
}

TEST(AssetLedgerTest, HookCanRejectTransfer) {
    InMemoryAssetLedger assets;
    ASSERT_TRUE(assets.Mint(STK, Address(1), 100));

    int calls = 0;
    assets.SetTransferHook([&](const AssetId&, const AccountId&, const AccountId& to, Amount) {
        ++calls;
        if (to == Address(9)) {
            return TransferResult::Failure("frozen");
        }
        return TransferResult::Success();
    });

    TransferResult rejected = assets.Transfer(STK, Address(1), Address(9), 10);
    EXPECT_FALSE(rejected.ok);
    EXPECT_EQ(rejected.error, "frozen");
    EXPECT_TRUE(assets.Transfer(STK, Address(1), Address(2), 10).ok);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(assets.BalanceOf(STK, Address(9)), 0);

    assets.SetTransferHook(nullptr);
    EXPECT_TRUE(assets.Transfer(STK, Address(1), Address(9), 10).ok);
    EXPECT_EQ(calls, 2);
}

// ============================================================================
// RoleRegistry Tests
// ============================================================================

TEST(RoleRegistryTest, GrantAndRevoke) {
    RoleRegistry roles;
    EXPECT_FALSE(roles.HasRole(Address(1), roles::POOL_ADMIN));

    EXPECT_TRUE(roles.Grant(Address(1), roles::POOL_ADMIN));
    EXPECT_FALSE(roles.Grant(Address(1), roles::POOL_ADMIN));
    EXPECT_TRUE(roles.HasRole(Address(1), roles::POOL_ADMIN));
    EXPECT_FALSE(roles.HasRole(Address(1), "auditor"));

    EXPECT_TRUE(roles.Revoke(Address(1), roles::POOL_ADMIN));
    EXPECT_FALSE(roles.Revoke(Address(1), roles::POOL_ADMIN));
    EXPECT_FALSE(roles.HasRole(Address(1), roles::POOL_ADMIN));
}

TEST(RoleRegistryTest, Members) {
    RoleRegistry roles;
    roles.Grant(Address(2), roles::POOL_ADMIN);
    roles.Grant(Address(1), roles::POOL_ADMIN);
    roles.Grant(Address(3), "auditor");

    auto admins = roles.Members(roles::POOL_ADMIN);
    ASSERT_EQ(admins.size(), 2u);
    EXPECT_EQ(admins[0], Address(1));
    EXPECT_EQ(admins[1], Address(2));
    EXPECT_TRUE(roles.Members("nobody").empty());
}

// ============================================================================
// Clock Tests
// ============================================================================

TEST(ClockTest, ManualClockNeverMovesBackwards) {
    ManualClock clock(100);
    EXPECT_EQ(clock.Now(), 100);
    EXPECT_EQ(clock.Set(50), 100);
    EXPECT_EQ(clock.Set(150), 150);
    EXPECT_EQ(clock.Advance(-10), 150);
    EXPECT_EQ(clock.Advance(10), 160);
}

TEST(ClockTest, ManualClockSaturates) {
    ManualClock clock(MAX_AMOUNT - 1);
    EXPECT_EQ(clock.Advance(10), MAX_AMOUNT);
}

TEST(ClockTest, SystemClockFollowsMockTime) {
    util::SetMockTime(1700000000);
    util::EnableMockTime();
    SystemClock clock;
    EXPECT_EQ(clock.Now(), 1700000000);
    util::DisableMockTime();
    util::SetMockTime(0);
    EXPECT_GT(clock.Now(), 1700000000);
}

// ============================================================================
// Status and Record Tests
// ============================================================================

TEST(LedgerStatusTest, ToString) {
    EXPECT_EQ(LedgerStatus::Ok().ToString(), "OK");
    EXPECT_EQ(LedgerStatus::Validation("bad").ToString(), "ValidationError: bad");
    EXPECT_EQ(LedgerStatus::State("busy").ToString(), "StateError: busy");
    EXPECT_EQ(LedgerStatus::Authorization("no").ToString(), "AuthorizationError: no");
    EXPECT_EQ(LedgerStatus::Arithmetic("big").ToString(), "ArithmeticError: big");
    EXPECT_TRUE(LedgerStatus::State("x").IsState());
    EXPECT_FALSE(LedgerStatus::State("x").ok());
}

TEST(LedgerTypesTest, LockupPolicyParsing) {
    LockupPolicy policy = LockupPolicy::FromFirstStake;
    EXPECT_TRUE(ParseLockupPolicy("ResetOnTopUp", policy));
    EXPECT_EQ(policy, LockupPolicy::ResetOnTopUp);
    EXPECT_TRUE(ParseLockupPolicy("first", policy));
    EXPECT_EQ(policy, LockupPolicy::FromFirstStake);
    EXPECT_FALSE(ParseLockupPolicy("sometimes", policy));
    EXPECT_EQ(policy, LockupPolicy::FromFirstStake);

    EXPECT_STREQ(LockupPolicyToString(LockupPolicy::ResetOnTopUp), "ResetOnTopUp");
    EXPECT_STREQ(PositionStateToString(PositionState::FullyWithdrawn), "FullyWithdrawn");
    EXPECT_STREQ(LedgerEventTypeToString(LedgerEventType::RewardClaimed), "RewardClaimed");
}

TEST(LedgerTypesTest, PositionStateFollowsAmount) {
    StakePosition position;
    position.amount = 10;
    position.active = true;
    EXPECT_EQ(position.State(), PositionState::Active);

    position.amount = 0;
    position.active = false;
    EXPECT_EQ(position.State(), PositionState::FullyWithdrawn);
}

TEST(LedgerTypesTest, DerivedAccountsAreDistinct) {
    EXPECT_EQ(StakingLedger::DeriveCustodyAccount(1), StakingLedger::DeriveCustodyAccount(1));
    EXPECT_NE(StakingLedger::DeriveCustodyAccount(1), StakingLedger::DeriveCustodyAccount(2));
    EXPECT_NE(StakingLedger::DeriveCustodyAccount(1), StakingLedger::DeriveRewardReserve(1));
    EXPECT_FALSE(StakingLedger::DeriveRewardReserve(7).IsNull());
}

// StakeLedger - Time Utility Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/util/time.h>

namespace stakeledger {
namespace util {
namespace {

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
        SetMockTime(0);
    }

    void TearDown() override {
        DisableMockTime();
        SetMockTime(0);
    }
};

TEST_F(TimeTest, GetTimeIsRecent) {
    // Later than 2024-01-01
    EXPECT_GT(GetTime(), 1704067200);
    EXPECT_FALSE(IsMockTimeEnabled());
}

TEST_F(TimeTest, MockTime) {
    SetMockTime(1700000000);
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1700000000);

    AdvanceMockTime(Seconds(90));
    EXPECT_EQ(GetTime(), 1700000090);
    EXPECT_EQ(GetMockTime(), 1700000090);

    DisableMockTime();
    EXPECT_NE(GetTime(), 1700000090);
}

TEST_F(TimeTest, EnableWithoutValueFreezesCurrentTime) {
    int64_t before = GetTime();
    EnableMockTime();
    int64_t frozen = GetTime();
    EXPECT_GE(frozen, before);
    EXPECT_EQ(GetTime(), frozen);
}

TEST_F(TimeTest, UnixTimeConversion) {
    SystemTimePoint tp = FromUnixTime(1700000000);
    EXPECT_EQ(ToUnixTime(tp), 1700000000);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1705314600), "2024-01-15T10:30:00Z");
}

} // namespace
} // namespace util
} // namespace stakeledger

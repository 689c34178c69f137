// StakeLedger - Logging Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/util/logging.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace stakeledger {
namespace util {
namespace {

// ============================================================================
// Test Fixture
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured_;
};

// ============================================================================
// Levels
// ============================================================================

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, TryParseLogLevelIsStrict) {
    LogLevel level = LogLevel::Error;
    EXPECT_TRUE(TryParseLogLevel("Warn", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(TryParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::Warn);
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    Capture();
    LOG_DEBUG(LogCategory::LEDGER) << "hidden";
    LOG_INFO(LogCategory::LEDGER) << "stake " << 42;
    LOG_ERROR(LogCategory::DB) << "write failed";

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].message, "stake 42");
    EXPECT_EQ(captured_[0].category, LogCategory::LEDGER);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_EQ(captured_[1].level, LogLevel::Error);
    EXPECT_EQ(GetBasename(captured_[1].file), "test_logging.cpp");
}

TEST_F(LoggingTest, SinkLevelFiltersSeparately) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    Capture(LogLevel::Warn);

    LOG_INFO(LogCategory::SERVICE) << "quiet";
    LOG_WARN(LogCategory::SERVICE) << "loud";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "loud");
}

TEST_F(LoggingTest, CategoryFiltering) {
    auto& logger = Logger::Instance();
    Capture();

    logger.EnableCategory(LogCategory::ADMIN);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::ADMIN));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    LOG_INFO(LogCategory::LEDGER) << "filtered";
    LOG_INFO(LogCategory::ADMIN) << "pool created";
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "pool created");

    logger.DisableCategory(LogCategory::ADMIN);
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::ADMIN));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
}

TEST_F(LoggingTest, PrintfStyle) {
    Capture();
    LogInfoF(LogCategory::ACCRUAL, "pool %d at %s", 7, "t=10");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "pool 7 at t=10");
}

TEST_F(LoggingTest, OffSuppressesEverything) {
    Capture();
    Logger::Instance().SetLevel(LogLevel::Off);
    LOG_ERROR(LogCategory::DEFAULT) << "nothing";
    EXPECT_TRUE(captured_.empty());
}

// ============================================================================
// FileSink
// ============================================================================

TEST_F(LoggingTest, FileSinkWritesAndRotates) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("stakeledger_log_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);

    FileSink::Config config;
    config.path = (dir / "ledger.log").string();
    config.maxSize = 64;
    config.maxFiles = 2;
    config.autoFlush = true;

    auto sink = std::make_shared<FileSink>(config);
    ASSERT_TRUE(sink->IsOpen());
    Logger::Instance().AddSink(sink);

    for (int i = 0; i < 5; ++i) {
        LOG_INFO(LogCategory::DB) << "snapshot written " << i;
    }
    sink->Flush();

    EXPECT_TRUE(std::filesystem::exists(config.path + ".1"));

    std::ifstream in(config.path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("snapshot written 4"), std::string::npos);
    EXPECT_NE(content.str().find("[db]"), std::string::npos);

    Logger::Instance().ClearSinks();
    sink.reset();
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_F(LoggingTest, FileSinkReportsUnopenablePath) {
    FileSink::Config config;
    config.path = "/nonexistent-dir/stakeledger/ledger.log";
    FileSink sink(config);
    EXPECT_FALSE(sink.IsOpen());
}

// ============================================================================
// Utilities
// ============================================================================

TEST(LoggingUtilTest, FormatLogTimestamp) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
    EXPECT_EQ(FormatLogTimestamp(tp), "2023-11-14T22:13:20.123Z");
}

TEST(LoggingUtilTest, GetBasename) {
    EXPECT_EQ(GetBasename("src/ledger/ledger.cpp"), "ledger.cpp");
    EXPECT_EQ(GetBasename("ledger.cpp"), "ledger.cpp");
}

} // namespace
} // namespace util
} // namespace stakeledger

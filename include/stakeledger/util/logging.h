// StakeLedger - Logging System
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Leveled, category-filtered logging with pluggable sinks:
// - Levels TRACE..FATAL, OFF
// - Ledger-specific categories (ledger, accrual, admin, db, service, config)
// - Console, file and callback sinks
// - Stream-style and printf-style macros

#ifndef STAKELEDGER_UTIL_LOGGING_H
#define STAKELEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace stakeledger {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse log level name (case-insensitive). Unknown names map to Info.
LogLevel LogLevelFromString(const std::string& str);

/// Strict variant: returns false for unknown names
bool TryParseLogLevel(const std::string& str, LogLevel& out);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";     // stake / withdraw / claim
    constexpr const char* ACCRUAL = "accrual";   // checkpoint math
    constexpr const char* ADMIN = "admin";       // pool creation, rate and status changes
    constexpr const char* DB = "db";
    constexpr const char* SERVICE = "service";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes formatted entries to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        /// Send Error and above to stderr
        bool useStderr{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }

private:
    Config config_;
    std::atomic<LogLevel> level_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends entries to a log file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{3};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_.store(level); }

    const std::string& GetPath() const { return config_.path; }

private:
    Config config_;
    std::atomic<LogLevel> level_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void OpenLocked();
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Forwards entries to a user function (used by tests to capture output)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_.store(level); }

private:
    Callback callback_;
    std::atomic<LogLevel> level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKELEDGER_LOGGER ::stakeledger::util::Logger::Instance()

#define STAKELEDGER_LOG_ENABLED(level, category) \
    STAKELEDGER_LOGGER.WillLog(::stakeledger::util::LogLevel::level, category)

#define STAKELEDGER_LOG(level, category) \
    if (!STAKELEDGER_LOG_ENABLED(level, category)) {} else \
        ::stakeledger::util::LogStream(::stakeledger::util::LogLevel::level, category, \
                                       __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   STAKELEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKELEDGER_LOG(Debug, category)
#define LOG_INFO(category)    STAKELEDGER_LOG(Info, category)
#define LOG_WARN(category)    STAKELEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   STAKELEDGER_LOG(Error, category)

#define STAKELEDGER_LOGF(level, category, ...) \
    do { \
        if (STAKELEDGER_LOG_ENABLED(level, category)) { \
            STAKELEDGER_LOGGER.LogF(::stakeledger::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogInfoF(category, ...)   STAKELEDGER_LOGF(Info, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Basename of a source path ("src/ledger/ledger.cpp" -> "ledger.cpp")
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_LOGGING_H

// StakeLedger - Time Utilities Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace stakeledger {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t RealTime() {
        return std::chrono::duration_cast<Seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return RealTime();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint(Seconds(timestamp));
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(RealTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace stakeledger

// StakeLedger - Time Utilities
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Unix timestamps, ISO 8601 formatting and a process-wide mock time
// used by tests.

#ifndef STAKELEDGER_UTIL_TIME_H
#define STAKELEDGER_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace stakeledger {
namespace util {

using Seconds = std::chrono::seconds;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

SystemTimePoint FromUnixTime(int64_t timestamp);

int64_t ToUnixTime(SystemTimePoint tp);

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

// ============================================================================
// Mock Time
// ============================================================================

/// Freeze GetTime() at the current time (or the last mock value)
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_TIME_H

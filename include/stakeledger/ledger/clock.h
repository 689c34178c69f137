// StakeLedger - Clocks
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// The only time source the ledger consults.

#ifndef STAKELEDGER_LEDGER_CLOCK_H
#define STAKELEDGER_LEDGER_CLOCK_H

#include "stakeledger/core/types.h"

#include <mutex>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Clock Interface
// ============================================================================

class Clock {
public:
    virtual ~Clock() = default;

    /// Current time in Unix seconds
    virtual Timestamp Now() const = 0;
};

// ============================================================================
// SystemClock
// ============================================================================

/// Wall clock; follows util mock time when it is enabled
class SystemClock : public Clock {
public:
    Timestamp Now() const override;
};

// ============================================================================
// ManualClock
// ============================================================================

/// Settable clock for tests and replay. Never moves backwards.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp Now() const override;

    /// Set the time; earlier values are ignored. Returns the resulting time.
    Timestamp Set(Timestamp t);

    /// Move forward by d seconds (negative d is ignored)
    Timestamp Advance(Duration d);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_CLOCK_H

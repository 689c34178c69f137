// StakeLedger - Clocks Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/clock.h"
#include "stakeledger/util/time.h"

namespace stakeledger {
namespace ledger {

Timestamp SystemClock::Now() const {
    return util::GetTime();
}

Timestamp ManualClock::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

Timestamp ManualClock::Set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (t > now_) {
        now_ = t;
    }
    return now_;
}

Timestamp ManualClock::Advance(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (d > 0) {
        auto next = CheckedAdd(now_, d);
        now_ = next ? *next : MAX_AMOUNT;
    }
    return now_;
}

} // namespace ledger
} // namespace stakeledger

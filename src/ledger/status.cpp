// StakeLedger - Ledger Status
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/ledger/status.h"

namespace stakeledger {
namespace ledger {

const char* LedgerStatusCodeName(LedgerStatus::Code code) {
    switch (code) {
        case LedgerStatus::OK: return "OK";
        case LedgerStatus::VALIDATION: return "ValidationError";
        case LedgerStatus::STATE: return "StateError";
        case LedgerStatus::AUTHORIZATION: return "AuthorizationError";
        case LedgerStatus::ARITHMETIC: return "ArithmeticError";
    }
    return "Unknown";
}

std::string LedgerStatus::ToString() const {
    if (ok()) {
        return "OK";
    }
    return std::string(LedgerStatusCodeName(code_)) + ": " + message_;
}

} // namespace ledger
} // namespace stakeledger

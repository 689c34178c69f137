// StakeLedger - Ledger Status
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Result of a ledger operation. A failed operation leaves ledger state
// untouched.

#ifndef STAKELEDGER_LEDGER_STATUS_H
#define STAKELEDGER_LEDGER_STATUS_H

#include <string>

namespace stakeledger {
namespace ledger {

class LedgerStatus {
public:
    enum Code {
        OK = 0,
        VALIDATION = 1,     // malformed input, amount out of range, unknown pool
        STATE = 2,          // operation not allowed in the current state
        AUTHORIZATION = 3,  // caller lacks the required role
        ARITHMETIC = 4,     // overflow in reward or balance math
    };

    LedgerStatus() : code_(OK) {}
    LedgerStatus(Code code, const std::string& msg) : code_(code), message_(msg) {}

    static LedgerStatus Ok() { return LedgerStatus(); }
    static LedgerStatus Validation(const std::string& msg) { return LedgerStatus(VALIDATION, msg); }
    static LedgerStatus State(const std::string& msg) { return LedgerStatus(STATE, msg); }
    static LedgerStatus Authorization(const std::string& msg) { return LedgerStatus(AUTHORIZATION, msg); }
    static LedgerStatus Arithmetic(const std::string& msg) { return LedgerStatus(ARITHMETIC, msg); }

    bool ok() const { return code_ == OK; }
    bool IsValidation() const { return code_ == VALIDATION; }
    bool IsState() const { return code_ == STATE; }
    bool IsAuthorization() const { return code_ == AUTHORIZATION; }
    bool IsArithmetic() const { return code_ == ARITHMETIC; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "ValidationError: amount below minimum stake"
    std::string ToString() const;

    bool operator==(const LedgerStatus& other) const {
        return code_ == other.code_ && message_ == other.message_;
    }
    bool operator!=(const LedgerStatus& other) const { return !(*this == other); }

private:
    Code code_;
    std::string message_;
};

const char* LedgerStatusCodeName(LedgerStatus::Code code);

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_STATUS_H

// StakeLedger - Core Types Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include "stakeledger/core/types.h"

#include <algorithm>
#include <cctype>

namespace stakeledger {

// ============================================================================
// Uint128 Formatting
// ============================================================================

std::string Uint128ToString(Uint128 value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for identifier");
    }

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        Byte high = hexCharToNibble(digits[i * 2]);
        Byte low = hexCharToNibble(digits[i * 2 + 1]);
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// AssetId Implementation
// ============================================================================

bool AssetId::IsValid() const {
    if (symbol.empty() || symbol.size() > 16) {
        return false;
    }
    return std::all_of(symbol.begin(), symbol.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_';
    });
}

} // namespace stakeledger

// StakeLedger - Core Types Header
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// This file defines fundamental types used throughout StakeLedger.

#ifndef STAKELEDGER_CORE_TYPES_H
#define STAKELEDGER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stakeledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest asset units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// Pool identifier (assigned sequentially, starting at 1)
using PoolId = uint64_t;

/// Unsigned 128-bit integer for fixed-point reward math
using Uint128 = __uint128_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// Largest 128-bit value
constexpr Uint128 UINT128_MAX_VALUE = ~static_cast<Uint128>(0);

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, or nullopt on overflow
inline std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    Amount out;
    if (__builtin_add_overflow(a, b, &out)) return std::nullopt;
    return out;
}

/// a - b, or nullopt on overflow
inline std::optional<Amount> CheckedSub(Amount a, Amount b) {
    Amount out;
    if (__builtin_sub_overflow(a, b, &out)) return std::nullopt;
    return out;
}

inline std::optional<Uint128> CheckedAdd128(Uint128 a, Uint128 b) {
    Uint128 out;
    if (__builtin_add_overflow(a, b, &out)) return std::nullopt;
    return out;
}

inline std::optional<Uint128> CheckedMul128(Uint128 a, Uint128 b) {
    Uint128 out;
    if (__builtin_mul_overflow(a, b, &out)) return std::nullopt;
    return out;
}

/// Decimal representation of a 128-bit value
std::string Uint128ToString(Uint128 value);

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic byte order (matches storage key order)
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Lowercase hex, first byte first
    std::string ToHex() const;

    /// Parse hex; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit digest (request fingerprints, key derivation)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit identifier - account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account on the asset ledger
using AccountId = Hash160;

/// Asset identifier (ticker-like symbol, e.g. "STK")
struct AssetId {
    std::string symbol;

    AssetId() = default;
    explicit AssetId(std::string s) : symbol(std::move(s)) {}

    bool IsValid() const;

    bool operator==(const AssetId& other) const { return symbol == other.symbol; }
    bool operator!=(const AssetId& other) const { return symbol != other.symbol; }
    bool operator<(const AssetId& other) const { return symbol < other.symbol; }
};

} // namespace stakeledger

#endif // STAKELEDGER_CORE_TYPES_H

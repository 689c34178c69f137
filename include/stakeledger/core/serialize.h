// StakeLedger - Serialization Header
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Little-endian record encoding for the ledger storage layer. Integers
// are written byte by byte, so the encoding does not depend on host
// byte order.

#ifndef STAKELEDGER_CORE_SERIALIZE_H
#define STAKELEDGER_CORE_SERIALIZE_H

#include "stakeledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace stakeledger {

/// Longest string a record may carry (asset symbols are far shorter)
static constexpr uint32_t MAX_SERIALIZED_STRING = 1 << 16;

// ============================================================================
// DataStream
// ============================================================================

/// Append-only byte buffer with a read cursor
class DataStream {
public:
    DataStream() = default;

    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const { return data_.size() - readPos_; }

    bool empty() const { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const { return data_.data() + readPos_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Read(uint8_t* dst, size_t len) {
        if (len == 0) {
            return;
        }
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + readPos_, len);
        readPos_ += len;
    }

    /// Unread bytes as a storage value
    std::string str() const {
        return std::string(reinterpret_cast<const char*>(data()), size());
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t readPos_ = 0;
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    uint8_t buf[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(UInt));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    uint8_t buf[sizeof(UInt)];
    s.Read(buf, sizeof(UInt));
    UInt value = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(buf[i]) << (8 * i);
    }
    return value;
}

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

// Signed amounts and timestamps travel as their two's complement bits
template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { WriteLE(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE(s, static_cast<uint8_t>(a ? 1 : 0)); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = ReadLE<uint8_t>(s) != 0; }

// 128-bit accumulators: low word first
template<typename Stream>
inline void Serialize(Stream& s, Uint128 a) { WriteLE(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, Uint128& a) { a = ReadLE<Uint128>(s); }

// ============================================================================
// Strings, Identifiers
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteLE(s, static_cast<uint32_t>(str.size()));
    s.Write(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint32_t size = ReadLE<uint32_t>(s);
    if (size > MAX_SERIALIZED_STRING) {
        throw std::ios_base::failure("Unserialize(): string too large");
    }
    std::vector<uint8_t> buf(size);
    s.Read(buf.data(), size);
    str.assign(buf.begin(), buf.end());
}

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const AssetId& asset) {
    Serialize(s, asset.symbol);
}

template<typename Stream>
void Unserialize(Stream& s, AssetId& asset) {
    Unserialize(s, asset.symbol);
}

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace stakeledger

#endif // STAKELEDGER_CORE_SERIALIZE_H

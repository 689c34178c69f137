// StakeLedger - SHA256 Hash Function
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Incremental SHA-256 over OpenSSL's EVP interface.

#ifndef STAKELEDGER_CRYPTO_SHA256_H
#define STAKELEDGER_CRYPTO_SHA256_H

#include "stakeledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Forward declaration keeps OpenSSL headers out of the public interface
struct evp_md_ctx_st;

namespace stakeledger {

class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if OpenSSL cannot allocate a digest context
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Write a length-prefixed field so adjacent fields cannot run together
    SHA256& WriteField(const std::string& data);

    /// Finish and reset for reuse
    void Finalize(Byte hash[OUTPUT_SIZE]);

    SHA256& Reset();

private:
    evp_md_ctx_st* ctx_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace stakeledger

#endif // STAKELEDGER_CRYPTO_SHA256_H

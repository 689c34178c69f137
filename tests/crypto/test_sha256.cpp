// StakeLedger - SHA256 Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/crypto/sha256.h"
#include "stakeledger/core/types.h"

#include <string>

namespace stakeledger {
namespace test {

// ============================================================================
// Helper Functions
// ============================================================================

std::string DigestHex(SHA256& hasher) {
    Hash256 out;
    hasher.Finalize(out.data());
    return out.ToHex();
}

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash("").ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash("abc").ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq").ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    SHA256 hasher;
    hasher.Write("ab").Write("c");
    EXPECT_EQ(DigestHex(hasher), SHA256Hash("abc").ToHex());
}

TEST(SHA256Test, FinalizeResets) {
    SHA256 hasher;
    hasher.Write("abc");
    std::string first = DigestHex(hasher);

    hasher.Write("abc");
    EXPECT_EQ(DigestHex(hasher), first);
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    hasher.Write("garbage").Reset().Write("abc");
    EXPECT_EQ(DigestHex(hasher), SHA256Hash("abc").ToHex());
}

TEST(SHA256Test, FieldsDoNotRunTogether) {
    SHA256 a;
    a.WriteField("ab").WriteField("c");

    SHA256 b;
    b.WriteField("a").WriteField("bc");

    EXPECT_NE(DigestHex(a), DigestHex(b));
}

} // namespace test
} // namespace stakeledger

/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <matchops/sync/core/checksum.h>

#include <string>

namespace matchops::sync::test {

class ChecksumTest : public ::testing::Test {};

TEST_F(ChecksumTest, Sha256OfEmptyInput) {
    EXPECT_EQ(checksum::sha256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, Sha256KnownVector) {
    EXPECT_EQ(checksum::sha256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, Sha256IsLowercaseHex) {
    auto hash = checksum::sha256("matchops");

    ASSERT_EQ(hash.size(), 64u);
    for (char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST_F(ChecksumTest, Sha256HandlesEmbeddedNul) {
    std::string with_nul("a\0b", 3);

    EXPECT_NE(checksum::sha256(with_nul), checksum::sha256("ab"));
}

TEST_F(ChecksumTest, VerifySha256) {
    auto hash = checksum::sha256("roster");

    EXPECT_TRUE(checksum::verify_sha256("roster", hash));
    EXPECT_FALSE(checksum::verify_sha256("Roster", hash));
}

TEST_F(ChecksumTest, ShortHash) {
    auto hash = checksum::sha256("abc");

    EXPECT_EQ(checksum::short_hash(hash), "ba7816bf8f01");
    EXPECT_EQ(checksum::short_hash(hash, 4), "ba78");
    EXPECT_EQ(checksum::short_hash("abc", 12), "abc");
}

}  // namespace matchops::sync::test

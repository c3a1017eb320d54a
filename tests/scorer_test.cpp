//
// Copyright (c) 2024-2025 JLGxy
//

#include <string>

#include "gtest/gtest.h"
#include "scorer.h"

TEST(scorer, sha256) {
    EXPECT_EQ(arena::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(arena::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(scorer, exactMatch) {
    auto res = arena::score("hello world", "hello world", 7, 120);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(*res.score, 127);
    EXPECT_EQ(res.breakdown.compressed_bytes, 7u);
    EXPECT_EQ(res.breakdown.decompressor_bytes, 120u);
    EXPECT_FALSE(res.mismatch.has_value());
    EXPECT_EQ(res.error_code(), "");
}

TEST(scorer, firstDifferingByte) {
    auto res = arena::score("abcdef", "abcXef", 1, 1);
    ASSERT_FALSE(res.ok());
    ASSERT_TRUE(res.mismatch.has_value());
    EXPECT_EQ(res.mismatch->offset, 3u);
    EXPECT_EQ(res.error_code(), "DECOMPRESSION_MISMATCH");
    EXPECT_EQ(res.mismatch->expected_sha256, arena::sha256_hex("abcdef"));
    EXPECT_EQ(res.mismatch->actual_sha256, arena::sha256_hex("abcXef"));
    EXPECT_NE(res.mismatch->to_str().find("offset 3"), std::string::npos);
}

TEST(scorer, lengthMismatch) {
    auto shorter = arena::score("abcdef", "abc", 1, 1);
    ASSERT_TRUE(shorter.mismatch.has_value());
    EXPECT_EQ(shorter.mismatch->offset, 3u);
    EXPECT_EQ(shorter.mismatch->expected_length, 6u);
    EXPECT_EQ(shorter.mismatch->actual_length, 3u);

    auto longer = arena::score("abc", "abcdef", 1, 1);
    ASSERT_TRUE(longer.mismatch.has_value());
    EXPECT_EQ(longer.mismatch->offset, 3u);

    auto empty = arena::score("abc", "", 1, 1);
    ASSERT_TRUE(empty.mismatch.has_value());
    EXPECT_EQ(empty.mismatch->offset, 0u);
}

TEST(scorer, emptyDataset) {
    auto res = arena::score("", "", 0, 30);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(*res.score, 30);
}

//
// Copyright (c) 2024-2025 JLGxy
//

#include <string>

#include "base64.h"
#include "gtest/gtest.h"

using arena::sb_base64::base64_decode;
using arena::sb_base64::base64_encode;

TEST(base64, knownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64_decode("Zm9vYg==").value(), "foob");
    EXPECT_EQ(base64_decode("").value(), "");
}

TEST(base64, binary) {
    std::string all;
    for (int i = 0; i < 256; i++) all += static_cast<char>(i);
    EXPECT_EQ(base64_decode(base64_encode(all)).value(), all);
}

TEST(base64, whitespaceSkipped) {
    EXPECT_EQ(base64_decode("Zm9v\nYmFy\r\n").value(), "foobar");
    EXPECT_EQ(base64_decode(" Zm8= ").value(), "fo");
}

TEST(base64, invalid) {
    EXPECT_FALSE(base64_decode("Zm9").has_value());
    EXPECT_FALSE(base64_decode("Zm9v!").has_value());
    EXPECT_FALSE(base64_decode("Z===").has_value());
    EXPECT_FALSE(base64_decode("Zg==Zg==").has_value());
    EXPECT_FALSE(base64_decode("Zm-_").has_value());
}

/**
 * @file test_sha256.cpp
 * @brief SHA-256 digest tests
 */

#include "jsonts/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace jsonts::common;

TEST(SHA256, EmptyString)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, Abc)
{
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256, HelloWorld)
{
    EXPECT_EQ(sha256("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, TwoBlockMessage)
{
    // 56 bytes: the length no longer fits in the first block
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, MillionA)
{
    const std::string input(1'000'000, 'a');
    EXPECT_EQ(sha256(input), "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256, Prefixed)
{
    const std::string hash = sha256_prefixed("test");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
    EXPECT_EQ(hash.substr(7), sha256("test"));
}

TEST(SHA256, DifferentInputs)
{
    EXPECT_NE(sha256("a"), sha256("b"));
    EXPECT_NE(sha256("abc"), sha256("ABC"));
}

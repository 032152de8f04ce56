#include <gtest/gtest.h>
#include "core/crypto.hpp"

using namespace voxgate::core::crypto;

TEST(CryptoTest, Sha256KnownVector) {
    EXPECT_EQ(to_hex(sha256("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, HmacSha256KnownVector) {
    std::string key = "Jefe";
    auto mac = hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()),
                           "what do ya want for nothing?");
    EXPECT_EQ(to_hex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, Base64UrlHasNoPaddingOrStandardAlphabet) {
    EXPECT_EQ(base64url_encode(std::string("hi?")), "aGk_");
    EXPECT_EQ(base64url_encode(std::string("\xfb\xff")), "-_8");
    EXPECT_EQ(base64url_encode(std::string("a")), "YQ");
}

TEST(CryptoTest, Base64UrlDecode) {
    EXPECT_EQ(base64url_decode("YQ"), std::optional<std::string>("a"));
    EXPECT_EQ(base64url_decode("aGk_"), std::optional<std::string>("hi?"));
    EXPECT_EQ(base64url_decode(""), std::optional<std::string>(""));
}

TEST(CryptoTest, Base64UrlDecodeRejectsForeignCharacters) {
    EXPECT_FALSE(base64url_decode("aGk/").has_value());
    EXPECT_FALSE(base64url_decode("YQ==").has_value());
    EXPECT_FALSE(base64url_decode("Y").has_value());
}

TEST(CryptoTest, ConstantTimeEquals) {
    EXPECT_TRUE(constant_time_equals(std::string("abc"), std::string("abc")));
    EXPECT_FALSE(constant_time_equals(std::string("abc"), std::string("abd")));
    EXPECT_FALSE(constant_time_equals(std::string("abc"), std::string("abcd")));
}

TEST(CryptoTest, RandomHexLengthAndAlphabet) {
    auto a = random_hex(20);
    auto b = random_hex(20);
    EXPECT_EQ(a.size(), 40u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

/**
 * @file TokenGeneratorTest.cpp
 * @brief Unit tests for TokenGenerator
 */

#include <gtest/gtest.h>
#include "utils/TokenGenerator.hpp"
#include <cctype>
#include <set>

using emulator::utils::TokenGenerator;

TEST(TokenGeneratorTest, Generate_Base64UrlWithoutPadding) {
    std::string token = TokenGenerator::generate();

    EXPECT_EQ(token.size(), 43u);
    for (char c : token) {
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        EXPECT_TRUE(allowed) << "unexpected character '" << c << "'";
    }
}

TEST(TokenGeneratorTest, Generate_Unique) {
    std::set<std::string> tokens;
    for (int i = 0; i < 1000; ++i) {
        tokens.insert(TokenGenerator::generate());
    }
    EXPECT_EQ(tokens.size(), 1000u);
}

TEST(TokenGeneratorTest, GenerateHex_Length) {
    std::string hex = TokenGenerator::generateHex(8);

    EXPECT_EQ(hex.size(), 16u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(TokenGeneratorTest, Base64UrlEncode_KnownValues) {
    EXPECT_EQ(TokenGenerator::base64UrlEncode(""), "");
    EXPECT_EQ(TokenGenerator::base64UrlEncode("f"), "Zg");
    EXPECT_EQ(TokenGenerator::base64UrlEncode("fo"), "Zm8");
    EXPECT_EQ(TokenGenerator::base64UrlEncode("foo"), "Zm9v");
    EXPECT_EQ(TokenGenerator::base64UrlEncode("foobar"), "Zm9vYmFy");
}

TEST(TokenGeneratorTest, Base64UrlEncode_UsesUrlAlphabet) {
    std::string bytes = {static_cast<char>(0xFB), static_cast<char>(0xFF)};
    EXPECT_EQ(TokenGenerator::base64UrlEncode(bytes), "-_8");
}

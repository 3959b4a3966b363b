/**
 * @file FormUrlEncodedTest.cpp
 * @brief Unit tests for FormUrlEncoded
 */

#include <gtest/gtest.h>
#include "utils/FormUrlEncoded.hpp"

using emulator::utils::FormUrlEncoded;

TEST(FormUrlEncodedTest, Parse_SimplePairs) {
    auto fields = FormUrlEncoded::parse("grant_type=authorization_code&code=AUTH_CODE_x");

    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields["grant_type"], "authorization_code");
    EXPECT_EQ(fields["code"], "AUTH_CODE_x");
}

TEST(FormUrlEncodedTest, Parse_DecodesPercentAndPlus) {
    auto fields = FormUrlEncoded::parse("email=user%40example.com&note=hello+world");

    EXPECT_EQ(fields["email"], "user@example.com");
    EXPECT_EQ(fields["note"], "hello world");
}

TEST(FormUrlEncodedTest, Parse_KeyWithoutValue_EmptyString) {
    auto fields = FormUrlEncoded::parse("flag&x=1");

    ASSERT_EQ(fields.count("flag"), 1u);
    EXPECT_EQ(fields["flag"], "");
    EXPECT_EQ(fields["x"], "1");
}

TEST(FormUrlEncodedTest, Parse_EmptyBody_NoFields) {
    EXPECT_TRUE(FormUrlEncoded::parse("").empty());
    EXPECT_TRUE(FormUrlEncoded::parse("&&").empty());
}

TEST(FormUrlEncodedTest, Parse_RepeatedKey_LastWins) {
    auto fields = FormUrlEncoded::parse("a=1&a=2");
    EXPECT_EQ(fields["a"], "2");
}

TEST(FormUrlEncodedTest, Decode_InvalidEscape_KeptAsIs) {
    EXPECT_EQ(FormUrlEncoded::decode("100%"), "100%");
    EXPECT_EQ(FormUrlEncoded::decode("%zz"), "%zz");
}

TEST(FormUrlEncodedTest, Encode_ReservedCharacters) {
    EXPECT_EQ(FormUrlEncoded::encode("abc 123"), "abc%20123");
    EXPECT_EQ(FormUrlEncoded::encode("http://localhost:8080/cb"), "http%3A%2F%2Flocalhost%3A8080%2Fcb");
    EXPECT_EQ(FormUrlEncoded::encode("a-b_c.d~e"), "a-b_c.d~e");
}

TEST(FormUrlEncodedTest, EncodeThenParse_Utf8Value) {
    std::string value = "合同会社 & co";
    auto fields = FormUrlEncoded::parse("name=" + FormUrlEncoded::encode(value));
    EXPECT_EQ(fields["name"], value);
}

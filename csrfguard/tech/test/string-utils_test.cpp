#include <gtest/gtest.h>

#include <array>
#include <string_view>

#include "csrfguard/ascii.hpp"
#include "csrfguard/char-hexadecimal-converter.hpp"
#include "csrfguard/string-equal-ignore-case.hpp"
#include "csrfguard/string-trim.hpp"

namespace csrfguard {

TEST(CaseInsensitiveEqual, Basic) {
  static_assert(CaseInsensitiveEqual("POST", "post"));
  EXPECT_TRUE(CaseInsensitiveEqual("Confirm-Action", "confirm-action"));
  EXPECT_FALSE(CaseInsensitiveEqual("post", "posts"));
  EXPECT_FALSE(CaseInsensitiveEqual("get", "got"));
}

TEST(StartsWithCaseInsensitive, Basic) {
  EXPECT_TRUE(StartsWithCaseInsensitive("Application/X-Www-Form-Urlencoded; charset=utf-8",
                                        "application/x-www-form-urlencoded"));
  EXPECT_FALSE(StartsWithCaseInsensitive("text", "text/html"));
}

TEST(StartsWithWord, RespectsWordBoundary) {
  EXPECT_TRUE(StartsWithWord("/api", "/api"));
  EXPECT_TRUE(StartsWithWord("/api/3/action/package_create", "/api"));
  EXPECT_TRUE(StartsWithWord("/api.json", "/api"));
  EXPECT_TRUE(StartsWithWord("/api-docs", "/api"));
  EXPECT_FALSE(StartsWithWord("/apis", "/api"));
  EXPECT_FALSE(StartsWithWord("/api_v2", "/api"));
  EXPECT_FALSE(StartsWithWord("/dataset/api", "/api"));
  EXPECT_FALSE(StartsWithWord("/API", "/api"));
}

TEST(StartsWithWord, PrefixEndingWithSeparator) {
  EXPECT_TRUE(StartsWithWord("/internal/x", "/internal/"));
  EXPECT_FALSE(StartsWithWord("/internals", "/internal/"));
}

TEST(Ascii, Blank) {
  EXPECT_TRUE(IsBlank(""));
  EXPECT_TRUE(IsBlank(" \t\r\n"));
  EXPECT_FALSE(IsBlank(" a "));
}

TEST(Ascii, WordChars) {
  EXPECT_TRUE(IsWordChar('_'));
  EXPECT_TRUE(IsWordChar('Z'));
  EXPECT_TRUE(IsWordChar('7'));
  EXPECT_FALSE(IsWordChar('/'));
  EXPECT_FALSE(IsWordChar('-'));
}

TEST(StringTrim, Ows) {
  EXPECT_EQ(TrimOws(" \tvalue\t "), "value");
  EXPECT_EQ(TrimOws("\r\nvalue"), "\r\nvalue");
  EXPECT_EQ(TrimOws("   "), "");
}

TEST(StringTrim, AsciiSpace) {
  EXPECT_EQ(TrimAsciiSpace("\r\n token \n"), "token");
  EXPECT_EQ(TrimAsciiSpace(""), "");
}

TEST(CharHexadecimalConverter, ToLowerHex) {
  static constexpr std::array<unsigned char, 4> kBytes{0x00, 0x0f, 0xa5, 0xff};
  EXPECT_EQ(ToLowerHex(kBytes), "000fa5ff");
  EXPECT_EQ(ToLowerHex({}), "");
}

TEST(CharHexadecimalConverter, FromHexDigit) {
  EXPECT_EQ(from_hex_digit('0'), 0);
  EXPECT_EQ(from_hex_digit('a'), 10);
  EXPECT_EQ(from_hex_digit('F'), 15);
  EXPECT_EQ(from_hex_digit('g'), -1);
}

}  // namespace csrfguard

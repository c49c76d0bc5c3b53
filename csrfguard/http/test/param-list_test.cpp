#include "csrfguard/param-list.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace csrfguard {

TEST(ParamList, ParseUrlEncodedPreservesOrderAndDuplicates) {
  auto params = ParamList::ParseUrlEncoded("name=my+dataset&tag=a&tag=b%2Cc&notes=");
  ASSERT_EQ(params.size(), 4U);
  EXPECT_EQ(params.find("name"), "my dataset");
  EXPECT_EQ(params.count("tag"), 2U);
  auto tags = params.values("tag");
  ASSERT_EQ(tags.size(), 2U);
  EXPECT_EQ(tags[0], "a");
  EXPECT_EQ(tags[1], "b,c");
  EXPECT_EQ(params.find("notes"), "");
}

TEST(ParamList, ParseUrlEncodedEdgeCases) {
  auto params = ParamList::ParseUrlEncoded("&&flag&=orphan&k%3Dy=v%3D");
  ASSERT_EQ(params.size(), 3U);
  auto it = params.begin();
  EXPECT_EQ(it->key, "flag");
  EXPECT_EQ(it->value, "");
  ++it;
  EXPECT_EQ(it->key, "");
  EXPECT_EQ(it->value, "orphan");
  ++it;
  EXPECT_EQ(it->key, "k=y");
  EXPECT_EQ(it->value, "v=");
}

TEST(ParamList, ParseEmpty) {
  EXPECT_TRUE(ParamList::ParseUrlEncoded("").empty());
  EXPECT_TRUE(ParamList::ParseCookieHeader("").empty());
}

TEST(ParamList, ParseCookieHeader) {
  auto cookies = ParamList::ParseCookieHeader("auth_tkt=\"abc!def\"; token=0123abcd;lang=en ; novalue; =anonymous");
  ASSERT_EQ(cookies.size(), 3U);
  EXPECT_EQ(cookies.find("auth_tkt"), "abc!def");
  EXPECT_EQ(cookies.find("token"), "0123abcd");
  EXPECT_EQ(cookies.find("lang"), "en");
  EXPECT_FALSE(cookies.contains("novalue"));
}

TEST(ParamList, CookieValuesAreNotPercentDecoded) {
  auto cookies = ParamList::ParseCookieHeader("k=a%20b+c");
  EXPECT_EQ(cookies.find("k"), "a%20b+c");
}

TEST(ParamList, EraseRemovesAllOccurrences) {
  ParamList params;
  params.append("token", "a").append("id", "x").append("token", "b");
  EXPECT_EQ(params.erase("token"), 2U);
  EXPECT_EQ(params.size(), 1U);
  EXPECT_EQ(params.erase("token"), 0U);
  EXPECT_EQ(params.find("id"), "x");
}

TEST(ParamList, TakeReturnsFirstAndRemovesAll) {
  ParamList params;
  params.append("token", "first").append("token", "second");
  EXPECT_EQ(params.take("token"), std::optional<std::string>("first"));
  EXPECT_TRUE(params.empty());
  EXPECT_EQ(params.take("token"), std::nullopt);
}

TEST(ParamList, KeysAreCaseSensitive) {
  ParamList params;
  params.append("Token", "v");
  EXPECT_EQ(params.count("token"), 0U);
  EXPECT_EQ(params.count("Token"), 1U);
}

}  // namespace csrfguard

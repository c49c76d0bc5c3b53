#include "csrfguard/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace csrfguard {

namespace {
std::string StrictDecode(std::string_view input, char plusAs = '+') {
  std::string buf(input);
  char* end = url::DecodeInPlace(buf.data(), buf.data() + buf.size(), plusAs);
  if (end == nullptr) {
    return "<invalid>";
  }
  buf.resize(static_cast<std::size_t>(end - buf.data()));
  return buf;
}
}  // namespace

TEST(UrlDecode, PlainStringUnchanged) { EXPECT_EQ(StrictDecode("/dataset/new"), "/dataset/new"); }

TEST(UrlDecode, PercentEscapes) {
  EXPECT_EQ(StrictDecode("/path%2Caaa"), "/path,aaa");
  EXPECT_EQ(StrictDecode("%41%62%63"), "Abc");
}

TEST(UrlDecode, PlusKeptForPaths) { EXPECT_EQ(StrictDecode("a+b"), "a+b"); }

TEST(UrlDecode, PlusAsSpace) { EXPECT_EQ(StrictDecode("a+b", ' '), "a b"); }

TEST(UrlDecode, StrictRejectsMalformed) {
  EXPECT_EQ(StrictDecode("abc%4"), "<invalid>");
  EXPECT_EQ(StrictDecode("abc%zz"), "<invalid>");
  EXPECT_EQ(StrictDecode("%"), "<invalid>");
}

TEST(UrlDecode, FormComponentBestEffort) {
  EXPECT_EQ(url::DecodeFormComponent("hello+world%21"), "hello world!");
  EXPECT_EQ(url::DecodeFormComponent("100%"), "100%");
  EXPECT_EQ(url::DecodeFormComponent("50%zz"), "50%zz");
  EXPECT_EQ(url::DecodeFormComponent("%%41"), "%A");
  EXPECT_EQ(url::DecodeFormComponent(""), "");
}

}  // namespace csrfguard

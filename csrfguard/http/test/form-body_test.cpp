#include "csrfguard/form-body.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

namespace csrfguard {
namespace {

std::string BuildBody(std::initializer_list<std::string_view> segments) {
  std::string body;
  for (auto segment : segments) {
    body.append(segment);
  }
  return body;
}

constexpr std::string_view kMultipartType = "multipart/form-data; boundary=\"XyZ\"";

}  // namespace

TEST(FormBody, IsFormContentType) {
  EXPECT_TRUE(IsFormContentType("application/x-www-form-urlencoded"));
  EXPECT_TRUE(IsFormContentType("Application/X-WWW-Form-Urlencoded; charset=UTF-8"));
  EXPECT_TRUE(IsFormContentType("multipart/form-data; boundary=abc"));
  EXPECT_FALSE(IsFormContentType("application/json"));
  EXPECT_FALSE(IsFormContentType(""));
}

TEST(FormBody, UrlEncoded) {
  auto fields = ParseFormBody("application/x-www-form-urlencoded; charset=utf-8", "token=abc&title=A+B");
  ASSERT_EQ(fields.size(), 2U);
  EXPECT_EQ(fields.find("token"), "abc");
  EXPECT_EQ(fields.find("title"), "A B");
}

TEST(FormBody, OtherContentTypesHaveNoFields) {
  EXPECT_TRUE(ParseFormBody("application/json", R"({"token":"abc"})").empty());
  EXPECT_TRUE(ParseFormBody("", "token=abc").empty());
}

TEST(FormBody, MultipartTextAndFileParts) {
  const std::string body = BuildBody({
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"token\"\r\n",
      "\r\n",
      "0123abcd\r\n",
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"upload\"; filename=\"data.csv\"\r\n",
      "Content-Type: text/csv\r\n",
      "\r\n",
      "a,b\r\n1,2\r\n",
      "--XyZ--\r\n",
  });

  auto fields = ParseFormBody(kMultipartType, body);
  ASSERT_EQ(fields.size(), 2U);
  EXPECT_EQ(fields.find("token"), "0123abcd");
  EXPECT_EQ(fields.find("upload"), "a,b\r\n1,2");
}

TEST(FormBody, MultipartDuplicateNames) {
  const std::string body = BuildBody({
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"token\"\r\n\r\n",
      "one\r\n",
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"token\"\r\n\r\n",
      "two\r\n",
      "--XyZ--",
  });

  auto fields = ParseFormBody(kMultipartType, body);
  EXPECT_EQ(fields.count("token"), 2U);
}

TEST(FormBody, MultipartMalformed) {
  EXPECT_THROW((void)ParseFormBody("multipart/form-data", "--XyZ\r\n"), std::invalid_argument);
  EXPECT_THROW((void)ParseFormBody(kMultipartType, "garbage"), std::invalid_argument);
  EXPECT_THROW((void)ParseFormBody(kMultipartType, "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue"),
               std::invalid_argument);
  EXPECT_THROW((void)ParseFormBody(kMultipartType, "--XyZ\r\nContent-Type: text/plain\r\n\r\nvalue\r\n--XyZ--"),
               std::invalid_argument);
  EXPECT_THROW((void)ParseFormBody(kMultipartType, "--XyZ\r\nContent-Disposition: inline; name=\"a\"\r\n\r\nv\r\n--XyZ--"),
               std::invalid_argument);
}

TEST(FormBody, MultipartPartLimit) {
  const std::string body = BuildBody({
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"a\"\r\n\r\n",
      "1\r\n",
      "--XyZ\r\n",
      "Content-Disposition: form-data; name=\"b\"\r\n\r\n",
      "2\r\n",
      "--XyZ--\r\n",
  });
  MultipartLimits limits;
  limits.maxParts = 1;
  EXPECT_THROW((void)ParseFormBody(kMultipartType, body, limits), std::invalid_argument);
}

}  // namespace csrfguard

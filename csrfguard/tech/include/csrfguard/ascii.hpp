#pragma once

#include <algorithm>
#include <string_view>

namespace csrfguard {

constexpr unsigned char tolower(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    ch |= 0x20;
  }
  return ch;
}

constexpr char tolower(char ch) { return static_cast<char>(tolower(static_cast<unsigned char>(ch))); }

constexpr bool IsAsciiAlnum(char ch) {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

// Same class as the regex '\w' for ASCII input.
constexpr bool IsWordChar(char ch) { return IsAsciiAlnum(ch) || ch == '_'; }

// Space, tab, CR, LF, vertical tab and form feed.
constexpr bool IsAsciiSpace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

// True if 'str' is empty or only made of ASCII whitespace.
constexpr bool IsBlank(std::string_view str) { return std::ranges::all_of(str, [](char ch) { return IsAsciiSpace(ch); }); }

constexpr bool IsLowerHexDigit(char ch) { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'); }

}  // namespace csrfguard

#pragma once

#include <string_view>

#include "csrfguard/ascii.hpp"

namespace csrfguard {

// Removes leading and trailing chars for which 'isTrimmed(ch)' is true.
template <class Pred>
constexpr std::string_view TrimIf(std::string_view sv, Pred isTrimmed) noexcept {
  while (!sv.empty() && isTrimmed(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && isTrimmed(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  return TrimIf(sv, [](char ch) { return ch == ' ' || ch == '\t'; });
}

// Trim any ASCII whitespace (including CR and LF).
constexpr std::string_view TrimAsciiSpace(std::string_view sv) noexcept {
  return TrimIf(sv, [](char ch) { return IsAsciiSpace(ch); });
}

}  // namespace csrfguard

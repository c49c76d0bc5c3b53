#pragma once

#include <cstddef>
#include <string_view>

#include "csrfguard/ascii.hpp"

namespace csrfguard {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Tells whether 'value' starts with 'prefix' and the prefix ends on a word boundary,
// that is, it is followed either by the end of 'value' or by a non word character.
// Examples with prefix "/api":
//   "/api"        -> true
//   "/api/action" -> true
//   "/api.json"   -> true
//   "/apis"       -> false
constexpr bool StartsWithWord(std::string_view value, std::string_view prefix) {
  if (!value.starts_with(prefix)) {
    return false;
  }
  if (value.size() == prefix.size() || prefix.empty()) {
    return true;
  }
  return !IsWordChar(prefix.back()) || !IsWordChar(value[prefix.size()]);
}

}  // namespace csrfguard

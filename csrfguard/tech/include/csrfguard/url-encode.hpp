#pragma once

#include <string>
#include <string_view>

#include "csrfguard/ascii.hpp"
#include "csrfguard/char-hexadecimal-converter.hpp"

namespace csrfguard::url {

/// Unreserved characters of RFC 3986 section 2.3, never percent-encoded.
constexpr bool IsUnreserved(char ch) noexcept {
  return IsAsciiAlnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

/// Returns 'data' where each char 'ch' for which keep(ch) is false is replaced by %NN (upper case hexadecimal).
template <class KeepFunc>
std::string Encode(std::string_view data, KeepFunc keep) {
  std::string::size_type encodedSize = 0;
  for (char ch : data) {
    encodedSize += keep(ch) ? 1U : 3U;
  }
  std::string ret(encodedSize, '\0');
  char *out = ret.data();
  for (char ch : data) {
    if (keep(ch)) {
      *out++ = ch;
    } else {
      *out++ = '%';
      out = to_upper_hex(static_cast<unsigned char>(ch), out);
    }
  }
  return ret;
}

/// Percent-encodes everything but the unreserved characters, suitable for a query string component.
inline std::string EncodeComponent(std::string_view data) { return Encode(data, IsUnreserved); }

}  // namespace csrfguard::url

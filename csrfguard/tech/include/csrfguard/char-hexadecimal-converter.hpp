#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace csrfguard {

namespace detail {

constexpr char *WriteHexPair(unsigned char byte, const char *hexits, char *out) {
  out[0] = hexits[byte >> 4U];
  out[1] = hexits[byte & 0x0FU];
  return out + 2;
}

}  // namespace detail

/// Writes the two lower case hexadecimal digits of 'ch' to 'buf' ('?' -> "3f").
/// Returns the position right after them.
constexpr char *to_lower_hex(unsigned char ch, char *buf) { return detail::WriteHexPair(ch, "0123456789abcdef", buf); }

constexpr char *to_lower_hex(char ch, char *buf) { return to_lower_hex(static_cast<unsigned char>(ch), buf); }

/// Upper case flavor of to_lower_hex ('?' -> "3F"), as used by percent-encoding.
constexpr char *to_upper_hex(unsigned char ch, char *buf) { return detail::WriteHexPair(ch, "0123456789ABCDEF", buf); }

/// Value of a single hexadecimal digit of any case, -1 if 'ch' is not one.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  const char lower = static_cast<char>(ch | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return 10 + (lower - 'a');
  }
  return -1;
}

/// Lower case hexadecimal representation of 'bytes', two chars per byte.
inline std::string ToLowerHex(std::span<const unsigned char> bytes) {
  std::string ret(bytes.size() * 2U, '\0');
  char *out = ret.data();
  for (unsigned char byte : bytes) {
    out = to_lower_hex(byte, out);
  }
  return ret;
}

}  // namespace csrfguard

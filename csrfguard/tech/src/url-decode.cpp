#include "csrfguard/url-decode.hpp"

#include <string>
#include <string_view>

#include "csrfguard/char-hexadecimal-converter.hpp"

namespace csrfguard::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          // keep the truncated escape as is
          for (; first < last; ++first) {
            *out++ = *first;
          }
          return out;
        }
        char c1 = first[1];
        char c2 = first[2];
        int v1 = from_hex_digit(c1);
        int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          // only the '%' is consumed, the following chars may start a valid escape
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string DecodeFormComponent(std::string_view component) {
  std::string ret(component);
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), ' ', /*strictInvalid*/ false);
  ret.resize(static_cast<std::string::size_type>(newEnd - ret.data()));
  return ret;
}

}  // namespace csrfguard::url

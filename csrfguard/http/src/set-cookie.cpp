#include "csrfguard/set-cookie.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

#include "csrfguard/ascii.hpp"

namespace csrfguard {

namespace {

constexpr std::string_view kTokenSpecials = "!#$%&'*+-.^_`|~";

// RFC 7230 §3.2.6 tchar
constexpr bool IsTokenChar(char ch) { return IsAsciiAlnum(ch) || kTokenSpecials.find(ch) != std::string_view::npos; }

// RFC 6265 §4.1.1 cookie-octet
constexpr bool IsCookieOctet(char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return uch == 0x21 || (uch >= 0x23 && uch <= 0x2B) || (uch >= 0x2D && uch <= 0x3A) || (uch >= 0x3C && uch <= 0x5B) ||
         (uch >= 0x5D && uch <= 0x7E);
}

constexpr std::string_view SameSiteStr(SetCookie::SameSite sameSite) {
  switch (sameSite) {
    case SetCookie::SameSite::Strict:
      return "Strict";
    case SetCookie::SameSite::Lax:
      return "Lax";
    case SetCookie::SameSite::None:
      return "None";
    default:
      return {};
  }
}

}  // namespace

SetCookie::SetCookie(std::string_view name, std::string_view value) : _name(name), _value(value) {
  if (name.empty() || !std::ranges::all_of(name, IsTokenChar)) {
    throw std::invalid_argument("invalid cookie name");
  }
  if (!std::ranges::all_of(value, IsCookieOctet)) {
    throw std::invalid_argument("invalid cookie value");
  }
}

std::string SetCookie::headerValue() const {
  std::string ret;
  ret.reserve(_name.size() + _value.size() + 64U);
  ret.append(_name).append(1, '=').append(_value);
  if (_maxAge) {
    ret.append("; Max-Age=").append(std::to_string(_maxAge->count()));
  }
  if (!_path.empty()) {
    ret.append("; Path=").append(_path);
  }
  if (!_domain.empty()) {
    ret.append("; Domain=").append(_domain);
  }
  if (_secure) {
    ret.append("; Secure");
  }
  if (_httpOnly) {
    ret.append("; HttpOnly");
  }
  if (_sameSite != SameSite::Unset) {
    ret.append("; SameSite=").append(SameSiteStr(_sameSite));
  }
  return ret;
}

}  // namespace csrfguard

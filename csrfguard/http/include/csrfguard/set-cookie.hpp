#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace csrfguard {

// Builder of a 'Set-Cookie' response header value (RFC 6265 §4.1).
class SetCookie {
 public:
  enum class SameSite : std::uint8_t { Unset, Strict, Lax, None };

  // Throws std::invalid_argument if 'name' is not a valid cookie name (RFC 7230 token)
  // or if 'value' contains chars not allowed in a cookie value.
  SetCookie(std::string_view name, std::string_view value);

  SetCookie& maxAge(std::chrono::seconds maxAge) {
    _maxAge = maxAge;
    return *this;
  }

  SetCookie& path(std::string_view path) {
    _path.assign(path);
    return *this;
  }

  SetCookie& domain(std::string_view domain) {
    _domain.assign(domain);
    return *this;
  }

  SetCookie& httpOnly(bool enable = true) {
    _httpOnly = enable;
    return *this;
  }

  SetCookie& secure(bool enable = true) {
    _secure = enable;
    return *this;
  }

  SetCookie& sameSite(SameSite sameSite) {
    _sameSite = sameSite;
    return *this;
  }

  [[nodiscard]] std::string_view name() const noexcept { return _name; }

  [[nodiscard]] std::string_view value() const noexcept { return _value; }

  // Attributes are emitted in this order: Max-Age, Path, Domain, Secure, HttpOnly, SameSite.
  // Example: "token=0f3c; Max-Age=600; Path=/; HttpOnly"
  [[nodiscard]] std::string headerValue() const;

 private:
  std::string _name;
  std::string _value;
  std::string _path{"/"};
  std::string _domain;
  std::optional<std::chrono::seconds> _maxAge;
  SameSite _sameSite{SameSite::Unset};
  bool _httpOnly{false};
  bool _secure{false};
};

}  // namespace csrfguard

#pragma once

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

#include "csrfguard/http-method.hpp"
#include "csrfguard/set-cookie.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

struct CsrfConfig {
  static constexpr std::size_t kMinTokenBytes = 32;
  static constexpr std::size_t kMaxTokenBytes = 256;

  // Validates the configuration. Throws std::invalid_argument on the first invalid field.
  void validate() const;

  // ==================
  // Token and cookie
  // ==================

  // Name shared by the token cookie, the hidden form field and the query string parameter.
  // Only ASCII letters, digits, '_' and '-' are accepted. Default: "token".
  std::string tokenFieldName{"token"};

  // Number of random bytes of freshly generated tokens. The token itself is the hexadecimal
  // representation of these bytes (so twice as many chars). Default: 32 (minimum).
  std::size_t tokenBytes{kMinTokenBytes};

  // Max-Age of the token cookie. Default: 600 s.
  std::chrono::seconds cookieMaxAge{600};

  // Emit the 'Secure' attribute on the token cookie. Default: false.
  bool cookieSecure{false};

  // SameSite attribute of the token cookie. Default: not emitted.
  SetCookie::SameSite cookieSameSite{SetCookie::SameSite::Unset};

  // ==================
  // Exemption rules
  // ==================

  // Requests whose path starts with one of these prefixes (ending on a word boundary) are never checked.
  // Each prefix should start with '/'. Default: {"/api"}.
  vector<std::string> exemptPathPrefixes{std::string("/api")};

  // Requests with these methods are never checked. POST can not be part of it. Default: GET, HEAD, OPTIONS.
  http::MethodBmp exemptMethods{http::kSafeMethods};

  // ==================
  // HTML rewriting
  // ==================

  // Value of the 'data-module' attribute identifying links performing a state changing action after a
  // client side confirmation. Same charset as tokenFieldName. Default: "confirm-action".
  std::string confirmActionModule{"confirm-action"};

  // ==================
  // Authentication
  // ==================

  // Name of the cookie whose non-empty presence tells that the caller is logged in, used by the default
  // authentication probe. Default: "auth_tkt".
  std::string authCookieName{"auth_tkt"};

  // ==================
  // Rejection
  // ==================

  // Body of the 403 response sent on any validation failure. The actual reason is only logged.
  std::string rejectionMessage{"Your form submission could not be validated"};

  CsrfConfig& withTokenFieldName(std::string_view name) {
    tokenFieldName.assign(name);
    return *this;
  }

  CsrfConfig& withTokenBytes(std::size_t nbBytes) {
    tokenBytes = nbBytes;
    return *this;
  }

  CsrfConfig& withCookieMaxAge(std::chrono::seconds maxAge) {
    cookieMaxAge = maxAge;
    return *this;
  }

  CsrfConfig& withCookieSecure(bool enable = true) {
    cookieSecure = enable;
    return *this;
  }

  CsrfConfig& withCookieSameSite(SetCookie::SameSite sameSite) {
    cookieSameSite = sameSite;
    return *this;
  }

  // Replaces the list of exempt path prefixes.
  CsrfConfig& withExemptPathPrefixes(std::initializer_list<std::string_view> prefixes);

  // Appends an exempt path prefix.
  CsrfConfig& addExemptPathPrefix(std::string_view prefix) {
    exemptPathPrefixes.emplace_back(prefix);
    return *this;
  }

  CsrfConfig& withExemptMethods(http::MethodBmp methods) {
    exemptMethods = methods;
    return *this;
  }

  CsrfConfig& withConfirmActionModule(std::string_view module) {
    confirmActionModule.assign(module);
    return *this;
  }

  CsrfConfig& withAuthCookieName(std::string_view name) {
    authCookieName.assign(name);
    return *this;
  }

  CsrfConfig& withRejectionMessage(std::string_view message) {
    rejectionMessage.assign(message);
    return *this;
  }
};

}  // namespace csrfguard

#include "csrfguard/csrf-config.hpp"

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>

#include "csrfguard/ascii.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/log.hpp"

namespace csrfguard {

namespace {

bool IsValidFieldName(std::string_view name) {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return IsWordChar(ch) || ch == '-'; });
}

}  // namespace

CsrfConfig& CsrfConfig::withExemptPathPrefixes(std::initializer_list<std::string_view> prefixes) {
  exemptPathPrefixes.clear();
  for (std::string_view prefix : prefixes) {
    exemptPathPrefixes.emplace_back(prefix);
  }
  return *this;
}

void CsrfConfig::validate() const {
  if (!IsValidFieldName(tokenFieldName)) {
    log::critical("CSRF token field name '{}' is invalid", tokenFieldName);
    throw std::invalid_argument("CSRF token field name should only contain letters, digits, '_' or '-'");
  }
  if (tokenBytes < kMinTokenBytes || tokenBytes > kMaxTokenBytes) {
    log::critical("CSRF token size {} is out of bounds [{}, {}]", tokenBytes, kMinTokenBytes, kMaxTokenBytes);
    throw std::invalid_argument("CSRF token size is out of bounds");
  }
  if (cookieMaxAge <= std::chrono::seconds{0}) {
    log::critical("CSRF cookie max age {}s should be strictly positive", cookieMaxAge.count());
    throw std::invalid_argument("CSRF cookie max age should be strictly positive");
  }
  if (cookieSameSite == SetCookie::SameSite::None && !cookieSecure) {
    log::critical("CSRF cookie with SameSite=None requires the Secure attribute");
    throw std::invalid_argument("CSRF cookie with SameSite=None requires the Secure attribute");
  }
  for (const std::string& prefix : exemptPathPrefixes) {
    if (prefix.empty() || prefix.front() != '/') {
      log::critical("CSRF exempt path prefix '{}' should start with '/'", prefix);
      throw std::invalid_argument("CSRF exempt path prefix should start with '/'");
    }
  }
  if (http::IsMethodSet(exemptMethods, http::Method::POST)) {
    log::critical("POST requests cannot be exempted from CSRF checks");
    throw std::invalid_argument("POST requests cannot be exempted from CSRF checks");
  }
  if (!IsValidFieldName(confirmActionModule)) {
    log::critical("CSRF confirm action module '{}' is invalid", confirmActionModule);
    throw std::invalid_argument("CSRF confirm action module should only contain letters, digits, '_' or '-'");
  }
  if (authCookieName.empty()) {
    log::critical("authentication cookie name should not be empty");
    throw std::invalid_argument("authentication cookie name should not be empty");
  }
  if (authCookieName == tokenFieldName) {
    // the token cookie is taken out of the request once read, the caller would then appear logged out
    log::critical("authentication cookie name '{}' should differ from the CSRF token field name", authCookieName);
    throw std::invalid_argument("authentication cookie name should differ from the CSRF token field name");
  }
}

}  // namespace csrfguard

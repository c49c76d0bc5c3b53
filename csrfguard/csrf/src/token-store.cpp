#include "csrfguard/token-store.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/ascii.hpp"
#include "csrfguard/char-hexadecimal-converter.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/csrf-error.hpp"
#include "csrfguard/http-constants.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/set-cookie.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

std::string GenerateRandomToken(std::size_t nbBytes) {
  vector<unsigned char> bytes(nbBytes);
  if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed generating CSRF token");
  }
  std::string token = ToLowerHex(std::span<const unsigned char>(bytes.data(), bytes.size()));
  ::OPENSSL_cleanse(bytes.data(), bytes.size());
  return token;
}

TokenStore::TokenStore(const CsrfConfig& config, TokenGenerator generator)
    : _generator(std::move(generator)),
      _fieldName(config.tokenFieldName),
      _tokenBytes(config.tokenBytes),
      _cookieMaxAge(config.cookieMaxAge),
      _cookieSameSite(config.cookieSameSite),
      _cookieSecure(config.cookieSecure) {
  if (!_generator) {
    throw std::invalid_argument("CSRF token generator should not be empty");
  }
}

std::string_view TokenStore::serverToken(RequestScope& scope) const {
  CsrfRequestContext& context = scope.csrf;
  if (context.serverToken) {
    return *context.serverToken;
  }

  std::string token;
  if (auto cookieToken = scope.request.cookies().take(_fieldName)) {
    token = std::move(*cookieToken);
  } else {
    token = _generator(_tokenBytes);
    if (!IsBlank(token)) {
      scope.response.addHeader(http::SetCookie, makeCookie(token).headerValue());
      context.cookieIssued = true;
      log::debug("Issued new CSRF token cookie for {}", scope.request.path());
    }
  }

  if (IsBlank(token)) {
    ServerTokenError error;
    log::error("{} on {}", error.what(), scope.request.path());
    throw error;
  }

  context.serverToken = std::move(token);
  return *context.serverToken;
}

SetCookie TokenStore::makeCookie(std::string_view token) const {
  SetCookie cookie(_fieldName, token);
  cookie.maxAge(_cookieMaxAge).httpOnly().secure(_cookieSecure).sameSite(_cookieSameSite);
  return cookie;
}

}  // namespace csrfguard

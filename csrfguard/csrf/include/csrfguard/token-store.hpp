#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "csrfguard/csrf-config.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/set-cookie.hpp"

namespace csrfguard {

// Produces a new token from the given number of random bytes.
using TokenGenerator = std::function<std::string(std::size_t nbBytes)>;

// Draws 'nbBytes' bytes from the OpenSSL CSPRNG and returns their lower case hexadecimal representation.
// Throws std::runtime_error if the random generator fails.
std::string GenerateRandomToken(std::size_t nbBytes);

// Resolves the token expected by the server for the current session.
class TokenStore {
 public:
  explicit TokenStore(const CsrfConfig& config, TokenGenerator generator = GenerateRandomToken);

  // Returns the server token of the request, establishing it if needed:
  //  1. token already resolved for this request (multi-fragment pages see the same value)
  //  2. token cookie sent by the client, which is then removed from the request cookies
  //  3. new random token, sent back in a 'Set-Cookie' header of the scope response
  // The returned view is valid as long as 'scope'.
  // Throws ServerTokenError if the resolved token is blank.
  std::string_view serverToken(RequestScope& scope) const;

  [[nodiscard]] std::string_view fieldName() const noexcept { return _fieldName; }

 private:
  [[nodiscard]] SetCookie makeCookie(std::string_view token) const;

  TokenGenerator _generator;
  std::string _fieldName;
  std::size_t _tokenBytes;
  std::chrono::seconds _cookieMaxAge;
  SetCookie::SameSite _cookieSameSite;
  bool _cookieSecure;
};

}  // namespace csrfguard

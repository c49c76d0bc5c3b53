#include "csrfguard/request-validator.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <string_view>

#include "csrfguard/csrf-error.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/string-equal-ignore-case.hpp"

namespace csrfguard {

bool TokensMatch(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return lhs.empty() || ::CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

RequestValidator::RequestValidator(const CsrfConfig& config, const TokenStore& tokenStore,
                                   const SubmittedTokenExtractor& extractor, const AuthenticationProbe& isAuthenticated)
    : _exemptPathPrefixes(config.exemptPathPrefixes),
      _tokenStore(tokenStore),
      _extractor(extractor),
      _isAuthenticated(isAuthenticated),
      _exemptMethods(config.exemptMethods) {}

bool RequestValidator::isPathExempt(std::string_view path) const {
  return std::ranges::any_of(_exemptPathPrefixes,
                             [path](std::string_view prefix) { return StartsWithWord(path, prefix); });
}

bool RequestValidator::isRequestExempt(const RequestScope& scope) const {
  const HttpRequest& request = scope.request;
  return !_isAuthenticated(request) || isPathExempt(request.path()) ||
         http::IsMethodSet(_exemptMethods, request.method());
}

ValidationOutcome RequestValidator::validate(RequestScope& scope) const {
  if (isRequestExempt(scope)) {
    return ValidationOutcome::Exempt;
  }
  std::string_view serverToken = _tokenStore.serverToken(scope);
  std::string_view submittedToken = _extractor.submittedToken(scope);
  if (!TokensMatch(serverToken, submittedToken)) {
    throw ClientValidationError(ClientValidationError::Reason::TokenMismatch);
  }
  log::debug("CSRF token validated for {} {}", http::MethodToStr(scope.request.method()), scope.request.path());
  return ValidationOutcome::Valid;
}

}  // namespace csrfguard

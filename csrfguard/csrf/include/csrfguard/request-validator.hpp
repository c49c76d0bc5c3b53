#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "csrfguard/authentication-probe.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/submitted-token.hpp"
#include "csrfguard/token-store.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

enum class ValidationOutcome : std::uint8_t { Exempt, Valid };

constexpr std::string_view ValidationOutcomeStr(ValidationOutcome outcome) {
  return outcome == ValidationOutcome::Exempt ? "exempt" : "valid";
}

// Decides whether an incoming request may reach the application.
// Holds references to the token store, the extractor and the probe, which should outlive it.
class RequestValidator {
 public:
  RequestValidator(const CsrfConfig& config, const TokenStore& tokenStore, const SubmittedTokenExtractor& extractor,
                   const AuthenticationProbe& isAuthenticated);

  // A request is exempt when the caller is not logged in, or its path starts with an exempt prefix
  // (followed by the end of the path or a non-word char), or its method is exempt (GET, HEAD, OPTIONS by default).
  [[nodiscard]] bool isRequestExempt(const RequestScope& scope) const;

  // Returns Exempt or Valid, or throws the CsrfError explaining why the request should be rejected.
  // The server token is resolved before the submitted one.
  ValidationOutcome validate(RequestScope& scope) const;

 private:
  [[nodiscard]] bool isPathExempt(std::string_view path) const;

  vector<std::string> _exemptPathPrefixes;
  const TokenStore& _tokenStore;
  const SubmittedTokenExtractor& _extractor;
  const AuthenticationProbe& _isAuthenticated;
  http::MethodBmp _exemptMethods;
};

// Constant time comparison of two tokens (only their length may leak).
[[nodiscard]] bool TokensMatch(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace csrfguard

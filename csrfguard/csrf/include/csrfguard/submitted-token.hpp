#pragma once

#include <string>
#include <string_view>

#include "csrfguard/csrf-config.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard {

// Reads the token presented by the client.
class SubmittedTokenExtractor {
 public:
  explicit SubmittedTokenExtractor(const CsrfConfig& config) : _fieldName(config.tokenFieldName) {}

  // Returns the submitted token, first match wins:
  //  1. token already extracted for this request
  //  2. the query string, only if the form body has no parameter and the query string has exactly one,
  //     which is the token (confirmation-action links)
  //  3. the single token field of the form body
  // The token parameter is removed from the list it was read from, so that it does not reach the
  // application. The returned view is valid as long as 'scope'.
  // Throws ClientValidationError (MissingToken or DuplicateToken) if the form body holds zero or
  // several token fields.
  std::string_view submittedToken(RequestScope& scope) const;

 private:
  std::string _fieldName;
};

}  // namespace csrfguard

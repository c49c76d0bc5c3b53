#include "csrfguard/submitted-token.hpp"

#include <cstddef>
#include <string_view>

#include "csrfguard/csrf-error.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/request-scope.hpp"

namespace csrfguard {

std::string_view SubmittedTokenExtractor::submittedToken(RequestScope& scope) const {
  CsrfRequestContext& context = scope.csrf;
  if (context.submittedToken) {
    return *context.submittedToken;
  }

  ParamList& formParams = scope.request.formParams();
  ParamList& queryParams = scope.request.queryParams();

  if (formParams.empty() && queryParams.size() == 1U && queryParams.count(_fieldName) == 1U) {
    context.submittedToken = queryParams.take(_fieldName);
    log::debug("CSRF token of {} read from the query string", scope.request.path());
    return *context.submittedToken;
  }

  const std::size_t nbFormTokens = formParams.count(_fieldName);
  if (nbFormTokens == 0) {
    throw ClientValidationError(ClientValidationError::Reason::MissingToken);
  }
  if (nbFormTokens > 1U) {
    throw ClientValidationError(ClientValidationError::Reason::DuplicateToken);
  }
  context.submittedToken = formParams.take(_fieldName);
  return *context.submittedToken;
}

}  // namespace csrfguard

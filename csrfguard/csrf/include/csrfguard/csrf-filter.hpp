#pragma once

#include <string>
#include <string_view>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/authentication-probe.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/html-rewriter.hpp"
#include "csrfguard/http-response.hpp"
#include "csrfguard/middleware.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/request-validator.hpp"
#include "csrfguard/submitted-token.hpp"
#include "csrfguard/token-store.hpp"

namespace csrfguard {

// Double Submit Cookie CSRF protection, as interceptors of the application render and dispatch hooks.
//
// Rendered HTML of logged in users receives the session token in each unsubmitted POST form and
// confirmation-action link. State changing requests of logged in users must present that same
// token (form field, or sole query string parameter), otherwise they are answered with a 403 before
// reaching the application.
//
// The filter is immutable once constructed: all per-request state lives in RequestScope::csrf.
// It is neither copyable nor movable as its components refer to each other.
class CsrfFilter {
 public:
  // Throws std::invalid_argument if 'config' is invalid or if one of the original hooks is empty.
  // An empty 'isAuthenticated' probe is replaced by CookieAuthenticationProbe(config.authCookieName).
  CsrfFilter(CsrfConfig config, const AppHooks& originals, AuthenticationProbe isAuthenticated = {},
             TokenGenerator tokenGenerator = GenerateRandomToken);

  CsrfFilter(const CsrfFilter&) = delete;
  CsrfFilter(CsrfFilter&&) = delete;
  CsrfFilter& operator=(const CsrfFilter&) = delete;
  CsrfFilter& operator=(CsrfFilter&&) = delete;

  ~CsrfFilter() = default;

  // Calls the original markup renderer, then applyToken on its output.
  std::string render(RequestScope& scope, std::string_view templateName, const RenderOptions& options) const;

  // Calls the original Jinja2 renderer, then applyToken on its output.
  std::string renderJinja2(RequestScope& scope, std::string_view templateName, const TemplateVars& extraVars) const;

  // Validates the request, then calls the original pre-dispatch hook and returns its result.
  // On any CSRF failure, logs the reason and short-circuits with rejectionResponse() instead.
  MiddlewareResult beforeAction(RequestScope& scope, const ActionCall& call) const;

  // Embeds the token in 'html' when the caller is logged in and 'html' has an unsubmitted POST form.
  // The token is the one already embedded in 'html' if any, the server token otherwise (possibly
  // issuing the token cookie). Returns 'html' unchanged when nothing applies.
  // Throws ServerTokenError if the server token is blank.
  std::string applyToken(RequestScope& scope, std::string html) const;

  // The generic 403 answered to rejected requests. Its body never tells the actual reason.
  [[nodiscard]] HttpResponse rejectionResponse() const;

  [[nodiscard]] const CsrfConfig& config() const noexcept { return _config; }

  [[nodiscard]] const HtmlRewriter& htmlRewriter() const noexcept { return _htmlRewriter; }

  [[nodiscard]] const RequestValidator& requestValidator() const noexcept { return _requestValidator; }

 private:
  CsrfConfig _config;
  RenderHook _rawRender;
  Jinja2RenderHook _rawRenderJinja2;
  BeforeActionHook _rawBeforeAction;
  AuthenticationProbe _isAuthenticated;
  TokenStore _tokenStore;
  SubmittedTokenExtractor _tokenExtractor;
  HtmlRewriter _htmlRewriter;
  RequestValidator _requestValidator;
};

}  // namespace csrfguard

#include "csrfguard/csrf-filter.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/authentication-probe.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/csrf-error.hpp"
#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/http-response.hpp"
#include "csrfguard/http-status-code.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/middleware.hpp"
#include "csrfguard/request-scope.hpp"
#include "csrfguard/token-store.hpp"

namespace csrfguard {

namespace {

CsrfConfig Validated(CsrfConfig config) {
  config.validate();
  return config;
}

// Only a few chars of a token are ever logged.
std::string_view TokenLogPrefix(std::string_view token) { return token.substr(0, 6); }

}  // namespace

CsrfFilter::CsrfFilter(CsrfConfig config, const AppHooks& originals, AuthenticationProbe isAuthenticated,
                       TokenGenerator tokenGenerator)
    : _config(Validated(std::move(config))),
      _rawRender(originals.render),
      _rawRenderJinja2(originals.renderJinja2),
      _rawBeforeAction(originals.beforeAction),
      _isAuthenticated(isAuthenticated ? std::move(isAuthenticated) : CookieAuthenticationProbe(_config.authCookieName)),
      _tokenStore(_config, std::move(tokenGenerator)),
      _tokenExtractor(_config),
      _htmlRewriter(_config),
      _requestValidator(_config, _tokenStore, _tokenExtractor, _isAuthenticated) {
  if (!_rawRender || !_rawRenderJinja2 || !_rawBeforeAction) {
    throw std::invalid_argument("CSRF filter requires the render, renderJinja2 and beforeAction hooks");
  }
}

std::string CsrfFilter::render(RequestScope& scope, std::string_view templateName, const RenderOptions& options) const {
  return applyToken(scope, _rawRender(scope, templateName, options));
}

std::string CsrfFilter::renderJinja2(RequestScope& scope, std::string_view templateName,
                                     const TemplateVars& extraVars) const {
  return applyToken(scope, _rawRenderJinja2(scope, templateName, extraVars));
}

MiddlewareResult CsrfFilter::beforeAction(RequestScope& scope, const ActionCall& call) const {
  try {
    ValidationOutcome outcome = _requestValidator.validate(scope);
    log::debug("{} {} is {} for CSRF", http::MethodToStr(scope.request.method()), scope.request.path(),
               ValidationOutcomeStr(outcome));
  } catch (const CsrfError& error) {
    log::error("Rejecting {} {} ({}#{}): {}", http::MethodToStr(scope.request.method()), scope.request.path(),
               call.controller, call.action, error.what());
    return MiddlewareResult::ShortCircuit(rejectionResponse());
  }
  return _rawBeforeAction(scope, call);
}

std::string CsrfFilter::applyToken(RequestScope& scope, std::string html) const {
  if (!_isAuthenticated(scope.request) || !_htmlRewriter.hasUnsubmittedPostForm(html)) {
    return html;
  }

  std::string_view token;
  if (auto embeddedToken = _htmlRewriter.findEmbeddedToken(html)) {
    token = *embeddedToken;
    log::debug("Reusing CSRF token {}... already embedded in {}", TokenLogPrefix(token), scope.request.path());
  } else {
    token = _tokenStore.serverToken(scope);
  }
  return _htmlRewriter.injectToken(html, token);
}

HttpResponse CsrfFilter::rejectionResponse() const {
  return HttpResponse(http::StatusCodeForbidden, http::ReasonForbidden)
      .body(_config.rejectionMessage, http::ContentTypeTextPlain);
}

}  // namespace csrfguard

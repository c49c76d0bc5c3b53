#pragma once

#include <optional>
#include <string>

#include "csrfguard/http-request.hpp"
#include "csrfguard/http-response.hpp"

namespace csrfguard {

// CSRF state of a single request. Lives as long as the request; never shared between requests.
struct CsrfRequestContext {
  // Token expected by the server, resolved on first need and reused by all subsequent renders of the request.
  std::optional<std::string> serverToken;
  // Token submitted by the client, consumed from the request parameters.
  std::optional<std::string> submittedToken;
  // Whether a fresh token cookie was added to the response.
  bool cookieIssued{false};
};

// Per-request bundle handed to every application hook.
// The framework creates one per incoming request, before the pre-dispatch hook, and drops it once
// the response is sent.
struct RequestScope {
  RequestScope(HttpRequest& req, HttpResponse& resp) noexcept : request(req), response(resp) {}

  HttpRequest& request;
  HttpResponse& response;
  CsrfRequestContext csrf;
};

}  // namespace csrfguard

// csrfguard Umbrella Header
//
// Include this single header to pull in the public CSRF protection API:
//   - Activation (InstallCsrfProtection) and the application hook table (AppHooks)
//   - The filter and its components (CsrfFilter, TokenStore, HtmlRewriter, RequestValidator)
//   - Configuration (CsrfConfig) and errors (CsrfError and subclasses)
//   - Request / Response primitives (HttpRequest, HttpResponse, SetCookie, MiddlewareResult)
//
// Usage Example:
//    #include <csrfguard/csrfguard.hpp>
//    using namespace csrfguard;
//    AppHooks hooks{myRender, myRenderJinja2, myBeforeAction};
//    InstallCsrfProtection(hooks, CsrfConfig{}.withCookieSecure());
//    // from now on, call hooks.render / hooks.renderJinja2 / hooks.beforeAction as before
//
// Each re-exported header line is annotated with IWYU pragma: export so that including only
// this header satisfies include-cleaner for the symbols they provide.

#pragma once

// Activation
#include "csrfguard/app-hooks.hpp"       // IWYU pragma: export
#include "csrfguard/csrf-installer.hpp"  // IWYU pragma: export

// Filter & components
#include "csrfguard/authentication-probe.hpp"  // IWYU pragma: export
#include "csrfguard/csrf-config.hpp"           // IWYU pragma: export
#include "csrfguard/csrf-error.hpp"            // IWYU pragma: export
#include "csrfguard/csrf-filter.hpp"           // IWYU pragma: export
#include "csrfguard/html-rewriter.hpp"         // IWYU pragma: export
#include "csrfguard/request-scope.hpp"         // IWYU pragma: export
#include "csrfguard/request-validator.hpp"     // IWYU pragma: export
#include "csrfguard/submitted-token.hpp"       // IWYU pragma: export
#include "csrfguard/token-store.hpp"           // IWYU pragma: export

// HTTP primitives
#include "csrfguard/http-constants.hpp"    // IWYU pragma: export
#include "csrfguard/http-method.hpp"       // IWYU pragma: export
#include "csrfguard/http-request.hpp"      // IWYU pragma: export
#include "csrfguard/http-response.hpp"     // IWYU pragma: export
#include "csrfguard/http-status-code.hpp"  // IWYU pragma: export
#include "csrfguard/middleware.hpp"        // IWYU pragma: export
#include "csrfguard/param-list.hpp"        // IWYU pragma: export
#include "csrfguard/set-cookie.hpp"        // IWYU pragma: export

#pragma once

#include <memory>

#include "csrfguard/app-hooks.hpp"
#include "csrfguard/authentication-probe.hpp"
#include "csrfguard/csrf-config.hpp"
#include "csrfguard/csrf-filter.hpp"
#include "csrfguard/token-store.hpp"

namespace csrfguard {

// Activates CSRF protection on the application hooks. Should be called once, at startup, before
// any request is served.
// The current render, renderJinja2 and beforeAction hooks become the originals called by a new
// CsrfFilter, and are replaced by its intercepting versions. The hooks share the ownership of
// the returned filter.
// Throws std::logic_error if 'hooks' are already protected, std::invalid_argument if 'config'
// is invalid or one of the hooks is empty. 'hooks' is left untouched on error.
std::shared_ptr<const CsrfFilter> InstallCsrfProtection(AppHooks& hooks, CsrfConfig config = {},
                                                        AuthenticationProbe isAuthenticated = {},
                                                        TokenGenerator tokenGenerator = GenerateRandomToken);

}  // namespace csrfguard

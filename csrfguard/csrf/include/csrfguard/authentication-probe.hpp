#pragma once

#include <functional>
#include <string>

#include "csrfguard/http-request.hpp"

namespace csrfguard {

// Tells whether the caller of given request is logged in.
// Login state itself is owned by the application, the filter only asks.
using AuthenticationProbe = std::function<bool(const HttpRequest&)>;

// Probe considering the caller logged in when the request carries a non-empty cookie of given name.
AuthenticationProbe CookieAuthenticationProbe(std::string cookieName);

}  // namespace csrfguard

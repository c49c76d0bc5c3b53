#include "csrfguard/authentication-probe.hpp"

#include <string>
#include <utility>

#include "csrfguard/http-request.hpp"

namespace csrfguard {

AuthenticationProbe CookieAuthenticationProbe(std::string cookieName) {
  return [cookieName = std::move(cookieName)](const HttpRequest& request) {
    const auto cookie = request.cookies().find(cookieName);
    return cookie.has_value() && !cookie->empty();
  };
}

}  // namespace csrfguard

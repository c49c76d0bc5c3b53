#pragma once

#include <cstdint>

namespace csrfguard::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeFound = 302;

inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;

}  // namespace csrfguard::http

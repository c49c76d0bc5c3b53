#pragma once

#include <string_view>

namespace csrfguard::http {

// Header field names are case-insensitive per RFC 7230. They are stored here in their
// conventional canonical form for emission; lookups compare them case-insensitively.

inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view CacheControl = "Cache-Control";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";

// Reason phrases
inline constexpr std::string_view ReasonForbidden = "Forbidden";

}  // namespace csrfguard::http

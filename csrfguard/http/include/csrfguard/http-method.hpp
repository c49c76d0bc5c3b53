#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace csrfguard::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

// Set of methods, one bit per Method.
using MethodBmp = std::underlying_type_t<Method>;

static_assert(kNbMethods <= sizeof(MethodBmp) * 8);

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(static_cast<MethodBmp>(lhs) | static_cast<MethodBmp>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | static_cast<MethodBmp>(rhs));
}

// Methods that never change server state (RFC 9110 §9.2.1), as far as CSRF checks are concerned.
inline constexpr MethodBmp kSafeMethods = Method::GET | Method::HEAD | Method::OPTIONS;

constexpr bool IsMethodSet(MethodBmp mask, Method method) { return (mask & static_cast<MethodBmp>(method)) != 0U; }

constexpr MethodIdx MethodToIdx(Method method) {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<MethodIdx>(method)));
}

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[MethodToIdx(method)]; }

// Parses a method token, ignoring case. std::nullopt for unknown methods.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace csrfguard::http

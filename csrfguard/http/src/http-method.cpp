#include "csrfguard/http-method.hpp"

#include <optional>
#include <string_view>

#include "csrfguard/string-equal-ignore-case.hpp"

namespace csrfguard::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[idx])) {
      return static_cast<Method>(1U << idx);
    }
  }
  return std::nullopt;
}

}  // namespace csrfguard::http

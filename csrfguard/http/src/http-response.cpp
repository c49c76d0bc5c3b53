#include "csrfguard/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/http-header.hpp"
#include "csrfguard/string-equal-ignore-case.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

vector<std::string_view> HttpResponse::headerValues(std::string_view name) const {
  vector<std::string_view> ret;
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      ret.emplace_back(header.value);
    }
  }
  return ret;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) & {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) & {
  const auto it =
      std::ranges::find_if(_headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  return *this;
}

}  // namespace csrfguard

#include "csrfguard/http-request.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/form-body.hpp"
#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-header.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/string-equal-ignore-case.hpp"
#include "csrfguard/url-decode.hpp"

namespace csrfguard {

HttpRequest::HttpRequest(http::Method method, std::string_view target) : _method(method) {
  if (target.empty() || target.front() != '/') {
    throw std::invalid_argument("request target should be in origin-form");
  }
  const auto questionMark = target.find('?');
  if (questionMark != std::string_view::npos) {
    _queryParams = ParamList::ParseUrlEncoded(target.substr(questionMark + 1));
    target = target.substr(0, questionMark);
  }
  _path.assign(target);
  const char* pathLast = url::DecodeInPlace(_path.data(), _path.data() + _path.size());
  if (pathLast == nullptr || pathLast == _path.data()) {
    throw std::invalid_argument("invalid percent encoding in request path");
  }
  _path.resize(static_cast<std::string::size_type>(pathLast - _path.data()));
}

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  if (CaseInsensitiveEqual(name, http::Cookie)) {
    _cookies.append(ParamList::ParseCookieHeader(value));
  }
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

HttpRequest& HttpRequest::body(std::string body, std::string_view contentType) {
  _formParams = ParseFormBody(contentType, body);
  _body = std::move(body);

  const auto it = std::ranges::find_if(
      _headers, [](const http::Header& header) { return CaseInsensitiveEqual(header.name, http::ContentType); });
  if (it == _headers.end()) {
    _headers.push_back(http::Header{std::string(http::ContentType), std::string(contentType)});
  } else {
    it->value.assign(contentType);
  }
  return *this;
}

}  // namespace csrfguard

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-header.hpp"
#include "csrfguard/http-status-code.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

// HTTP response under construction by the application and the filter.
// Headers are kept in insertion order; several headers with the same name are allowed (Set-Cookie).
// All setters exist in lvalue and rvalue flavors to allow both
//   response.status(403).body("...");
// and
//   return HttpResponse(403).body("...");
class HttpResponse {
 public:
  HttpResponse() = default;

  explicit HttpResponse(http::StatusCode code, std::string_view reason = {}) : _reason(reason), _status(code) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Value of the first header with given name (case-insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Values of all headers with given name, in insertion order.
  [[nodiscard]] vector<std::string_view> headerValues(std::string_view name) const;

  [[nodiscard]] const vector<http::Header>& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept { return std::move(status(statusCode)); }

  HttpResponse& status(http::StatusCode statusCode, std::string_view reason) & {
    _status = statusCode;
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode, std::string_view reason) && {
    return std::move(status(statusCode, reason));
  }

  // Appends a header, keeping any existing header with the same name.
  HttpResponse& addHeader(std::string_view name, std::string_view value) &;

  HttpResponse&& addHeader(std::string_view name, std::string_view value) && {
    return std::move(addHeader(name, value));
  }

  // Sets a header, replacing the first existing one with the same name (case-insensitive) if any.
  HttpResponse& header(std::string_view name, std::string_view value) &;

  HttpResponse&& header(std::string_view name, std::string_view value) && { return std::move(header(name, value)); }

  // Sets the body and its Content-Type.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    _body = std::move(body);
    return header(http::ContentType, contentType);
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(std::move(body), contentType));
  }

 private:
  std::string _reason;
  std::string _body;
  vector<http::Header> _headers;
  http::StatusCode _status{http::StatusCodeOK};
};

}  // namespace csrfguard

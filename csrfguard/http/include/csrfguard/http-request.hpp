#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/http-constants.hpp"
#include "csrfguard/http-header.hpp"
#include "csrfguard/http-method.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

// In-flight HTTP request as seen by the application hooks.
// Unlike the raw message, the parameter lists are mutable: the filter consumes the values it owns
// (CSRF token cookie, submitted token) so that they do not reach the business logic.
class HttpRequest {
 public:
  // Creates a request from its method and origin-form target ("/path?query").
  // The path is percent-decoded, the query string is decoded into queryParams().
  // Throws std::invalid_argument if the target does not start with '/' or if the path has an invalid
  // percent encoding.
  HttpRequest(http::Method method, std::string_view target);

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The URL decoded path (the target without the query params string).
  // It cannot be empty.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Adds a request header. Several 'Cookie' headers are allowed, their pairs are appended to cookies().
  HttpRequest& addHeader(std::string_view name, std::string_view value);

  // Value of the first header with given name (case-insensitive lookup), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Like headerValue() but returns an empty string_view for absent headers.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Sets the body of the request along with its Content-Type header.
  // Form bodies (url-encoded or multipart) are decoded into formParams(), replacing previous ones.
  // Throws std::invalid_argument if a multipart body is malformed.
  HttpRequest& body(std::string body, std::string_view contentType = http::ContentTypeFormUrlEncoded);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Decoded query string parameters, in order.
  [[nodiscard]] ParamList& queryParams() noexcept { return _queryParams; }
  [[nodiscard]] const ParamList& queryParams() const noexcept { return _queryParams; }

  // Decoded form fields of the body, in order. Empty for bodies that do not carry a form.
  [[nodiscard]] ParamList& formParams() noexcept { return _formParams; }
  [[nodiscard]] const ParamList& formParams() const noexcept { return _formParams; }

  // Cookies sent by the client.
  [[nodiscard]] ParamList& cookies() noexcept { return _cookies; }
  [[nodiscard]] const ParamList& cookies() const noexcept { return _cookies; }

 private:
  std::string _path;
  std::string _body;
  vector<http::Header> _headers;
  ParamList _queryParams;
  ParamList _formParams;
  ParamList _cookies;
  http::Method _method;
};

}  // namespace csrfguard

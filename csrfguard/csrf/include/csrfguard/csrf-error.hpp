#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace csrfguard {

// Base class of all CSRF failures. what() returns the server side reason, never sent to the client.
class CsrfError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The token the server expects could not be established (blank token cookie).
class ServerTokenError : public CsrfError {
 public:
  ServerTokenError() : CsrfError("Server token is blank") {}
};

// The client did not prove possession of the token.
class ClientValidationError : public CsrfError {
 public:
  enum class Reason : std::uint8_t { MissingToken, DuplicateToken, TokenMismatch };

  explicit ClientValidationError(Reason reason) : CsrfError(ReasonStr(reason).data()), _reason(reason) {}

  [[nodiscard]] Reason reason() const noexcept { return _reason; }

  static constexpr std::string_view ReasonStr(Reason reason) {
    switch (reason) {
      case Reason::MissingToken:
        return "Missing CSRF token in form submission";
      case Reason::DuplicateToken:
        return "More than one CSRF token in form submission";
      case Reason::TokenMismatch:
        return "Could not match session token with form token";
      default:
        return "Unknown CSRF validation failure";
    }
  }

 private:
  Reason _reason;
};

}  // namespace csrfguard

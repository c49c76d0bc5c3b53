#pragma once

#include <cstdint>
#include <utility>

#include "csrfguard/http-response.hpp"

namespace csrfguard {

// Outcome of a pre-dispatch hook: let the request reach its action, or answer it right away.
class MiddlewareResult {
 public:
  enum class Decision : std::uint8_t { Continue, ShortCircuit };

  // Continue.
  MiddlewareResult() noexcept = default;

  // Short-circuit with 'response'.
  explicit MiddlewareResult(HttpResponse response) noexcept
      : _decision(Decision::ShortCircuit), _response(std::move(response)) {}

  static MiddlewareResult Continue() noexcept { return {}; }

  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept { return MiddlewareResult(std::move(response)); }

  [[nodiscard]] Decision decision() const noexcept { return _decision; }

  [[nodiscard]] bool shouldContinue() const noexcept { return _decision == Decision::Continue; }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _decision == Decision::ShortCircuit; }

  // Response to send instead of dispatching. Default constructed when continuing.
  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  [[nodiscard]] HttpResponse&& takeResponse() && noexcept { return std::move(_response); }

 private:
  Decision _decision{Decision::Continue};
  HttpResponse _response;
};

}  // namespace csrfguard

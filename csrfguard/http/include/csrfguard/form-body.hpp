#pragma once

#include <cstddef>
#include <string_view>

#include "csrfguard/param-list.hpp"

namespace csrfguard {

struct MultipartLimits {
  std::size_t maxParts{128};
  std::size_t maxPartSizeBytes{32ULL * 1024ULL * 1024ULL};
};

// Tells whether given Content-Type header value designates a body carrying form fields.
[[nodiscard]] bool IsFormContentType(std::string_view contentType) noexcept;

// Decodes the form fields carried by a request body.
//   * application/x-www-form-urlencoded: see ParamList::ParseUrlEncoded.
//   * multipart/form-data: one entry per part, keyed by the 'name' parameter of its Content-Disposition.
//     File parts are included with their raw content as value.
//   * Any other content type yields an empty list.
// Throws std::invalid_argument if a multipart body is malformed.
ParamList ParseFormBody(std::string_view contentType, std::string_view body, MultipartLimits limits = {});

}  // namespace csrfguard

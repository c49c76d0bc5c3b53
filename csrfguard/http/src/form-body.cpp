#include "csrfguard/form-body.hpp"

#include <cstddef>
#include <stdexcept>
#include <string_view>

#include "csrfguard/http-constants.hpp"
#include "csrfguard/log.hpp"
#include "csrfguard/param-list.hpp"
#include "csrfguard/string-equal-ignore-case.hpp"
#include "csrfguard/string-trim.hpp"

namespace csrfguard {
namespace {

constexpr std::string_view kMultipartMediaType{"multipart/form-data"};
constexpr std::string_view kCRLF{"\r\n"};
constexpr std::string_view kDoubleCRLF{"\r\n\r\n"};
constexpr std::string_view kDoubleDash{"--"};

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

std::string_view MediaType(std::string_view contentType) {
  return TrimOws(contentType.substr(0, contentType.find(';')));
}

// Returns the value of the parameter 'paramName' of a header value of the form "type; key=value; key2=value2".
std::string_view HeaderParam(std::string_view headerValue, std::string_view paramName) {
  auto semicolon = headerValue.find(';');
  while (semicolon != std::string_view::npos) {
    headerValue.remove_prefix(semicolon + 1);
    semicolon = headerValue.find(';');
    const auto chunk = headerValue.substr(0, semicolon);
    const auto eq = chunk.find('=');
    if (eq != std::string_view::npos && CaseInsensitiveEqual(TrimOws(chunk.substr(0, eq)), paramName)) {
      return StripQuotes(TrimOws(chunk.substr(eq + 1)));
    }
  }
  return {};
}

[[noreturn]] void ThrowInvalidMultipart(std::string_view reason) {
  log::warn("Rejecting multipart body: {}", reason);
  throw std::invalid_argument("malformed multipart/form-data body");
}

// Returns the field name of a part from its header block, or throws.
std::string_view PartName(std::string_view headerBlock) {
  while (!headerBlock.empty()) {
    const auto lineEnd = headerBlock.find(kCRLF);
    const std::string_view line = headerBlock.substr(0, lineEnd);
    headerBlock = lineEnd == std::string_view::npos ? std::string_view{} : headerBlock.substr(lineEnd + kCRLF.size());
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      ThrowInvalidMultipart("part header missing colon");
    }
    if (!CaseInsensitiveEqual(TrimOws(line.substr(0, colon)), "Content-Disposition")) {
      continue;
    }
    const std::string_view disposition = TrimOws(line.substr(colon + 1));
    if (!CaseInsensitiveEqual(MediaType(disposition), "form-data")) {
      ThrowInvalidMultipart("part must have Content-Disposition: form-data");
    }
    const std::string_view name = HeaderParam(disposition, "name");
    if (name.empty()) {
      ThrowInvalidMultipart("part missing name parameter");
    }
    return name;
  }
  ThrowInvalidMultipart("part missing Content-Disposition header");
}

ParamList ParseMultipart(std::string_view contentType, std::string_view body, MultipartLimits limits) {
  const std::string_view boundary = HeaderParam(contentType, "boundary");
  if (boundary.empty()) {
    ThrowInvalidMultipart("boundary missing");
  }

  const auto consumeBoundary = [boundary](std::string_view& data) {
    if (!data.starts_with(kDoubleDash) || !data.substr(kDoubleDash.size()).starts_with(boundary)) {
      ThrowInvalidMultipart("missing boundary");
    }
    data.remove_prefix(kDoubleDash.size() + boundary.size());
  };

  ParamList fields;
  consumeBoundary(body);
  if (!body.starts_with(kCRLF)) {
    ThrowInvalidMultipart("boundary not followed by CRLF");
  }
  body.remove_prefix(kCRLF.size());

  while (true) {
    if (limits.maxParts != 0 && fields.size() >= limits.maxParts) {
      ThrowInvalidMultipart("exceeds part limit");
    }
    const auto headerEnd = body.find(kDoubleCRLF);
    if (headerEnd == std::string_view::npos) {
      ThrowInvalidMultipart("part missing header terminator");
    }
    const std::string_view name = PartName(body.substr(0, headerEnd));
    body.remove_prefix(headerEnd + kDoubleCRLF.size());

    std::size_t boundaryPos = 0;
    while (true) {
      boundaryPos = body.find("\r\n--", boundaryPos);
      if (boundaryPos == std::string_view::npos) {
        ThrowInvalidMultipart("part missing closing boundary");
      }
      if (body.substr(boundaryPos + kCRLF.size() + kDoubleDash.size()).starts_with(boundary)) {
        break;
      }
      boundaryPos += kCRLF.size();
    }
    if (limits.maxPartSizeBytes != 0 && boundaryPos > limits.maxPartSizeBytes) {
      ThrowInvalidMultipart("part exceeds size limit");
    }
    fields.append(name, body.substr(0, boundaryPos));
    body.remove_prefix(boundaryPos + kCRLF.size());

    consumeBoundary(body);
    const bool finalBoundary = body.starts_with(kDoubleDash);
    if (finalBoundary) {
      body.remove_prefix(kDoubleDash.size());
      if (!body.empty() && body != kCRLF) {
        ThrowInvalidMultipart("data after final boundary");
      }
      return fields;
    }
    if (!body.starts_with(kCRLF)) {
      ThrowInvalidMultipart("boundary missing CRLF");
    }
    body.remove_prefix(kCRLF.size());
  }
}

}  // namespace

bool IsFormContentType(std::string_view contentType) noexcept {
  const auto mediaType = MediaType(contentType);
  return CaseInsensitiveEqual(mediaType, http::ContentTypeFormUrlEncoded) ||
         CaseInsensitiveEqual(mediaType, kMultipartMediaType);
}

ParamList ParseFormBody(std::string_view contentType, std::string_view body, MultipartLimits limits) {
  const auto mediaType = MediaType(contentType);
  if (CaseInsensitiveEqual(mediaType, http::ContentTypeFormUrlEncoded)) {
    return ParamList::ParseUrlEncoded(body);
  }
  if (CaseInsensitiveEqual(mediaType, kMultipartMediaType)) {
    return ParseMultipart(contentType, body, limits);
  }
  return {};
}

}  // namespace csrfguard

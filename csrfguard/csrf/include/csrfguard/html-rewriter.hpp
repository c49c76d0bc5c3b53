#pragma once

#include <re2/re2.h>

#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/csrf-config.hpp"

namespace csrfguard {

// Embeds CSRF tokens in rendered HTML by targeted pattern matching of the known output shapes.
// This is not an HTML parser: only POST forms whose opening tag is followed by whitespace and
// confirmation-action links with a query-less href are recognized.
// Matching runs in linear time on RE2 automata, whatever the page size.
// Immutable after construction, it can be shared between threads. It is neither copyable nor movable.
class HtmlRewriter {
 public:
  explicit HtmlRewriter(const CsrfConfig& config);

  // Tells whether 'html' contains at least one POST form that has not received a token yet.
  [[nodiscard]] bool hasUnsubmittedPostForm(std::string_view html) const;

  // Returns the value of the first token hidden field already present in 'html', if any.
  // Only lower case hexadecimal values are recognized.
  [[nodiscard]] std::optional<std::string_view> findEmbeddedToken(std::string_view html) const;

  // Returns a copy of 'html' where
  //  - a hidden token field is inserted right after the opening tag of each unsubmitted POST form
  //  - '?<field>=<token>' is appended to the href of each confirmation-action link without query string,
  //    whatever the order of its 'data-module' and 'href' attributes
  // Applying it twice with the same token gives the same result as applying it once.
  [[nodiscard]] std::string injectToken(std::string_view html, std::string_view token) const;

  [[nodiscard]] std::string_view fieldName() const noexcept { return _fieldName; }

 private:
  std::string _fieldName;
  re2::RE2 _postForm;
  re2::RE2 _embeddedToken;
  re2::RE2 _confirmLink;
  re2::RE2 _confirmLinkReversed;
};

}  // namespace csrfguard

#include "csrfguard/html-rewriter.hpp"

#include <re2/re2.h>

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "csrfguard/csrf-config.hpp"
#include "csrfguard/html-escape.hpp"
#include "csrfguard/url-encode.hpp"

namespace csrfguard {

namespace {

// Field name and module are restricted to [A-Za-z0-9_-] by CsrfConfig::validate, so they can be
// spliced in the patterns without escaping.

// Pages are matched byte per byte, they do not need to be valid UTF-8.
RE2::Options PatternOptions(bool caseSensitive) {
  RE2::Options options;
  options.set_encoding(RE2::Options::EncodingLatin1);
  options.set_case_sensitive(caseSensitive);
  options.set_log_errors(false);
  return options;
}

// Matches only when whitespace follows the opening tag. Once a token is inserted right after it,
// the form no longer matches.
constexpr std::string_view kPostFormPattern = R"re((<form [^>]*method=["']post["'][^>]*>)([^<]*\s<))re";

std::string EmbeddedTokenPattern(std::string_view fieldName) {
  std::string pattern(R"re(<input type="hidden" name=")re");
  pattern.append(fieldName);
  pattern.append(R"re(" value="([0-9a-f]+)"/>)re");
  return pattern;
}

std::string ConfirmLinkPattern(std::string_view module) {
  std::string pattern(R"re((<a [^>]*data-module=["'])re");
  pattern.append(module);
  pattern.append(R"re(["'][^>]*href=["'][^"'?]+)(["']))re");
  return pattern;
}

std::string ConfirmLinkReversedPattern(std::string_view module) {
  std::string pattern(R"re((<a [^>]*href=["'][^"'?]+)(["'][^>]*data-module=["'])re");
  pattern.append(module);
  pattern.append(R"re(["']))re");
  return pattern;
}

void CheckCompiled(const re2::RE2& regex) {
  if (!regex.ok()) {
    throw std::invalid_argument("Invalid HTML rewriting pattern '" + regex.pattern() + "': " + regex.error());
  }
}

std::string_view ToStringView(re2::StringPiece piece) { return {piece.data(), piece.size()}; }

// Whole match and the two capturing groups of the form and link patterns.
constexpr int kNbGroups = 3;

// Replaces each match of 'pattern' in 'input' by its first group, then 'insertion', then its second group.
std::string InsertBetweenGroups(std::string_view input, const re2::RE2& pattern, std::string_view insertion) {
  std::string out;
  if (input.empty()) {
    return out;
  }
  out.reserve(input.size() + 256U);

  const re2::StringPiece text(input.data(), input.size());
  std::array<re2::StringPiece, kNbGroups> groups;
  std::size_t pos = 0;
  while (pos < input.size() && pattern.Match(text, pos, input.size(), RE2::UNANCHORED, groups.data(), kNbGroups)) {
    const std::string_view match = ToStringView(groups[0]);
    const auto matchPos = static_cast<std::size_t>(match.data() - input.data());
    out.append(input.substr(pos, matchPos - pos));
    out.append(ToStringView(groups[1]));
    out.append(insertion);
    out.append(ToStringView(groups[2]));
    // patterns never match the empty string
    pos = matchPos + match.size();
  }
  out.append(input.substr(pos));
  return out;
}

}  // namespace

HtmlRewriter::HtmlRewriter(const CsrfConfig& config)
    : _fieldName(config.tokenFieldName),
      _postForm(re2::StringPiece(kPostFormPattern.data(), kPostFormPattern.size()), PatternOptions(false)),
      _embeddedToken(EmbeddedTokenPattern(config.tokenFieldName), PatternOptions(true)),
      _confirmLink(ConfirmLinkPattern(config.confirmActionModule), PatternOptions(false)),
      _confirmLinkReversed(ConfirmLinkReversedPattern(config.confirmActionModule), PatternOptions(false)) {
  CheckCompiled(_postForm);
  CheckCompiled(_embeddedToken);
  CheckCompiled(_confirmLink);
  CheckCompiled(_confirmLinkReversed);
}

bool HtmlRewriter::hasUnsubmittedPostForm(std::string_view html) const {
  if (html.empty()) {
    return false;
  }
  return RE2::PartialMatch(re2::StringPiece(html.data(), html.size()), _postForm);
}

std::optional<std::string_view> HtmlRewriter::findEmbeddedToken(std::string_view html) const {
  re2::StringPiece token;
  if (html.empty() || !RE2::PartialMatch(re2::StringPiece(html.data(), html.size()), _embeddedToken, &token)) {
    return std::nullopt;
  }
  return ToStringView(token);
}

std::string HtmlRewriter::injectToken(std::string_view html, std::string_view token) const {
  std::string hiddenField(R"(<input type="hidden" name=")");
  hiddenField.append(_fieldName);
  hiddenField.append(R"(" value=")");
  AppendHtmlEscaped(hiddenField, token);
  hiddenField.append(R"("/>)");

  std::string linkQuery(1, '?');
  linkQuery.append(_fieldName);
  linkQuery.push_back('=');
  linkQuery.append(url::EncodeComponent(token));

  // order matters: a link rewritten by the forward pattern has a query string and is skipped by the reversed one
  std::string withForms = InsertBetweenGroups(html, _postForm, hiddenField);
  std::string withLinks = InsertBetweenGroups(withForms, _confirmLink, linkQuery);
  return InsertBetweenGroups(withLinks, _confirmLinkReversed, linkQuery);
}

}  // namespace csrfguard

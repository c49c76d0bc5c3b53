#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "csrfguard/vector.hpp"

namespace csrfguard {

// A single decoded key/value pair.
struct Param {
  bool operator==(const Param&) const noexcept = default;

  std::string key;
  std::string value;
};

// Ordered list of (possibly repeated) key/value pairs.
// Used for the query string parameters, the url-encoded body parameters and the request cookies.
// Order of insertion and duplicates are preserved. Key comparison is case-sensitive.
class ParamList {
 public:
  using const_iterator = vector<Param>::const_iterator;

  ParamList() noexcept = default;

  // Parses an application/x-www-form-urlencoded string (query string without '?', or request body).
  // Decoding rules:
  //  - Percent escapes decoded independently for key & value; malformed/incomplete escapes left verbatim.
  //  - '+' translated to space.
  //  - Missing '=' => value = "". Empty segments ("a=1&&b=2") are skipped.
  //  - Duplicate keys preserved in order.
  static ParamList ParseUrlEncoded(std::string_view encoded);

  // Parses the value of a 'Cookie' request header ("name1=value1; name2=value2").
  // Names and values are trimmed, surrounding double quotes of values are removed.
  // Values are not percent decoded. Pairs without '=' or with an empty name are ignored.
  static ParamList ParseCookieHeader(std::string_view cookieHeader);

  ParamList& append(std::string_view key, std::string_view value);

  // Appends all pairs of 'other' at the end of this list.
  ParamList& append(const ParamList& other);

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  // Number of occurrences of given key.
  [[nodiscard]] std::size_t count(std::string_view key) const noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key).has_value(); }

  // Value of the first occurrence of given key, if any.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;

  // Values of all occurrences of given key, in order.
  [[nodiscard]] vector<std::string_view> values(std::string_view key) const;

  // Removes all occurrences of given key. Returns the number of removed pairs.
  std::size_t erase(std::string_view key);

  // Returns the value of the first occurrence of given key, and removes all occurrences of it.
  std::optional<std::string> take(std::string_view key);

  [[nodiscard]] const_iterator begin() const noexcept { return _params.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.end(); }

 private:
  vector<Param> _params;
};

}  // namespace csrfguard

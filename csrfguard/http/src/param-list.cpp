#include "csrfguard/param-list.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "csrfguard/string-trim.hpp"
#include "csrfguard/url-decode.hpp"
#include "csrfguard/vector.hpp"

namespace csrfguard {

namespace {

// Splits 'str' on the first occurrence of 'sep'. The separator is removed from 'str' along with the returned chunk.
std::string_view NextChunk(std::string_view& str, char sep) {
  const auto sepPos = str.find(sep);
  const std::string_view chunk = sepPos == std::string_view::npos ? str : str.substr(0, sepPos);
  if (sepPos == std::string_view::npos) {
    str = {};
  } else {
    str.remove_prefix(sepPos + 1);
  }
  return chunk;
}

}  // namespace

ParamList ParamList::ParseUrlEncoded(std::string_view encoded) {
  ParamList ret;
  while (!encoded.empty()) {
    std::string_view pair = NextChunk(encoded, '&');
    if (pair.empty()) {
      continue;
    }
    const auto equalPos = pair.find('=');
    const std::string_view key = pair.substr(0, equalPos);
    const std::string_view value = equalPos == std::string_view::npos ? std::string_view{} : pair.substr(equalPos + 1);
    ret._params.push_back(Param{url::DecodeFormComponent(key), url::DecodeFormComponent(value)});
  }
  return ret;
}

ParamList ParamList::ParseCookieHeader(std::string_view cookieHeader) {
  ParamList ret;
  while (!cookieHeader.empty()) {
    std::string_view pair = NextChunk(cookieHeader, ';');
    const auto equalPos = pair.find('=');
    if (equalPos == std::string_view::npos) {
      continue;
    }
    const std::string_view name = TrimOws(pair.substr(0, equalPos));
    if (name.empty()) {
      continue;
    }
    std::string_view value = TrimOws(pair.substr(equalPos + 1));
    if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
      value = value.substr(1, value.size() - 2U);
    }
    ret.append(name, value);
  }
  return ret;
}

ParamList& ParamList::append(std::string_view key, std::string_view value) {
  _params.push_back(Param{std::string(key), std::string(value)});
  return *this;
}

ParamList& ParamList::append(const ParamList& other) {
  for (const Param& param : other) {
    _params.push_back(param);
  }
  return *this;
}

std::size_t ParamList::count(std::string_view key) const noexcept {
  return static_cast<std::size_t>(std::ranges::count_if(_params, [key](const Param& param) { return param.key == key; }));
}

std::optional<std::string_view> ParamList::find(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(_params, [key](const Param& param) { return param.key == key; });
  if (it == _params.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

vector<std::string_view> ParamList::values(std::string_view key) const {
  vector<std::string_view> ret;
  for (const Param& param : _params) {
    if (param.key == key) {
      ret.emplace_back(param.value);
    }
  }
  return ret;
}

std::size_t ParamList::erase(std::string_view key) {
  const auto newEnd =
      std::remove_if(_params.begin(), _params.end(), [key](const Param& param) { return param.key == key; });
  const auto nbErased = static_cast<std::size_t>(_params.end() - newEnd);
  _params.erase(newEnd, _params.end());
  return nbErased;
}

std::optional<std::string> ParamList::take(std::string_view key) {
  const auto it = std::ranges::find_if(_params, [key](const Param& param) { return param.key == key; });
  if (it == _params.end()) {
    return std::nullopt;
  }
  std::optional<std::string> ret(std::move(it->value));
  erase(key);
  return ret;
}

}  // namespace csrfguard

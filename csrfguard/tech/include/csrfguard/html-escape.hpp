#pragma once

#include <string>
#include <string_view>

namespace csrfguard {

// Appends 'text' to 'out', replacing the characters with a special meaning in HTML text and quoted
// attribute values by their entity references:
//  & -> &amp;   < -> &lt;   > -> &gt;   " -> &quot;   ' -> &#39;
void AppendHtmlEscaped(std::string& out, std::string_view text);

inline std::string HtmlEscape(std::string_view text) {
  std::string ret;
  AppendHtmlEscaped(ret, text);
  return ret;
}

}  // namespace csrfguard

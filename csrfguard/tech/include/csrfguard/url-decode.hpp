#pragma once

#include <string>
#include <string_view>

namespace csrfguard::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+'
// into 'plusAs'. Returns nullptr on invalid encoding (truncated % or non-hex digits) when
// 'strictInvalid' is true, leaving the buffer in an unspecified partially modified state.
// Otherwise malformed escapes are kept verbatim.
// Returns a pointer to the new logical end of the decoded sequence.
// plusAs should be ' ' only for application/x-www-form-urlencoded components, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Best effort decoding of a single application/x-www-form-urlencoded component ('+' means space).
std::string DecodeFormComponent(std::string_view component);

}  // namespace csrfguard::url

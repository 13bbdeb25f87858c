#pragma once

#include <string>
#include <string_view>

namespace turbo::url {

// Decodes within the provided buffer [first, last), compacting percent-encoded sequences and
// translating '+' into 'plusAs'. Returns nullptr on invalid encoding (truncated % or non-hex digits)
// when strictInvalid is true, leaving the buffer partially modified. Otherwise invalid sequences are kept
// verbatim. Returns a pointer to the new logical end of the decoded sequence.
// plusAs should stay '+' for paths, ' ' is for application/x-www-form-urlencoded query components.
char* DecodeInPlace(char* first, char* last, char plusAs = '+', bool strictInvalid = true);

// Best effort decoding of a query component (key or value) into a new string. '+' becomes a space.
std::string DecodeQueryComponent(std::string_view encoded);

// Strict decoding of a path segment. Returns false (and leaves 'out' unspecified) on invalid encoding.
bool DecodePathSegment(std::string_view encoded, std::string& out);

}  // namespace turbo::url

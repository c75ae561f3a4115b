#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace conduit::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' to 'plusAs'.
// Returns nullptr on invalid encoding (truncated % or non-hex digits) when strictInvalid is true, leaving the buffer
// in an unspecified partially modified state. Otherwise invalid sequences are kept literally.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, char* last, char plusAs = '+', bool strictInvalid = true);

// Same as DecodeInPlace, working on a copy. Returns std::nullopt on invalid encoding in strict mode.
std::optional<std::string> Decode(std::string_view encoded, char plusAs = '+', bool strictInvalid = true);

}  // namespace conduit::url

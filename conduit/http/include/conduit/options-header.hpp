#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "conduit/vector.hpp"

namespace conduit {

struct HeaderOption {
  std::string name;
  std::string value;

  bool operator==(const HeaderOption&) const = default;
};

// A structured header value such as 'text/html; charset=utf-8'.
struct OptionsHeader {
  // Case-insensitive lookup of an option value.
  [[nodiscard]] std::optional<std::string_view> option(std::string_view name) const noexcept;

  std::string value;
  vector<HeaderOption> options;
};

// Parse a structured header following the RFC 2231 parameter grammar:
//   primary; key=value; key="quoted \"value\""; key*0=part1; key*1=part2; key*=utf-8'en'%E2%82%AC
// Quoted values are stripped and unescaped, extended values are percent-decoded with their declared charset,
// continuation fragments are concatenated in index order onto their base key.
// Parsing is best-effort: it stops silently at the first fragment it cannot understand.
[[nodiscard]] OptionsHeader ParseOptionsHeader(std::string_view headerValue);

}  // namespace conduit

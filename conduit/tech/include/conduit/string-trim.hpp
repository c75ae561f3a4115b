#pragma once

#include <string_view>

namespace conduit {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && (*begin == ' ' || *begin == '\t')) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (*end != ' ' && *end != '\t') {
      ++end;
      break;
    }
  }
  return {begin, end};
}

// Trim any character of 'chars' on both sides.
constexpr std::string_view TrimChars(std::string_view sv, std::string_view chars) noexcept {
  const auto first = sv.find_first_not_of(chars);
  if (first == std::string_view::npos) {
    return {};
  }
  return sv.substr(first, sv.find_last_not_of(chars) - first + 1U);
}

}  // namespace conduit

#include "conduit/cookies.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "conduit/char-hexadecimal-converter.hpp"

namespace conduit {
namespace {

constexpr std::string_view kCookieSpaces = " \t\n\r\v\f";

std::string_view Strip(std::string_view value) {
  const auto first = value.find_first_not_of(kCookieSpaces);
  if (first == std::string_view::npos) {
    return {};
  }
  return value.substr(first, value.find_last_not_of(kCookieSpaces) - first + 1U);
}

}  // namespace

std::string UnquoteCookieValue(std::string_view value) {
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return std::string(value);
  }
  value = value.substr(1, value.size() - 2);

  std::string ret;
  ret.reserve(value.size());
  for (std::size_t pos = 0; pos < value.size(); ++pos) {
    const char ch = value[pos];
    if (ch != '\\' || pos + 1 == value.size()) {
      ret.push_back(ch);
      continue;
    }
    if (pos + 3 < value.size()) {
      const int d1 = from_oct_digit(value[pos + 1]);
      const int d2 = from_oct_digit(value[pos + 2]);
      const int d3 = from_oct_digit(value[pos + 3]);
      if (d1 >= 0 && d2 >= 0 && d3 >= 0) {
        // '\ooo'
        ret.push_back(static_cast<char>(((d1 << 6) | (d2 << 3) | d3) & 0xFF));
        pos += 3;
        continue;
      }
    }
    // '\c' -> 'c'
    ret.push_back(value[pos + 1]);
    ++pos;
  }
  return ret;
}

Cookies ParseCookies(std::string_view cookieHeader) {
  Cookies cookies;
  while (!cookieHeader.empty()) {
    const auto semicolon = cookieHeader.find(';');
    const std::string_view chunk = cookieHeader.substr(0, semicolon);
    cookieHeader = semicolon == std::string_view::npos ? std::string_view{} : cookieHeader.substr(semicolon + 1);

    const auto eq = chunk.find('=');
    const std::string_view key = Strip(chunk.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    const std::string_view value = eq == std::string_view::npos ? std::string_view{} : Strip(chunk.substr(eq + 1));
    cookies.insert_or_assign(std::string(key), UnquoteCookieValue(value));
  }
  return cookies;
}

}  // namespace conduit

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace conduit {

using Cookies = std::map<std::string, std::string, std::less<>>;

// Parse a 'cookie' request header ('a=1; b="x\"y"'). Quoted values are unescaped, later duplicates win.
[[nodiscard]] Cookies ParseCookies(std::string_view cookieHeader);

// Unquote a cookie value: surrounding double quotes removed, '\ooo' octal and '\c' escapes resolved.
// Values not surrounded by double quotes are returned unchanged.
[[nodiscard]] std::string UnquoteCookieValue(std::string_view value);

}  // namespace conduit

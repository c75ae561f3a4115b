#pragma once

#include <string_view>

namespace conduit::http {

// Header names travel in lower case on the connection events; lookups stay case-insensitive.

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view PATCH = "PATCH";

// Header field names
inline constexpr std::string_view ContentLength = "content-length";
inline constexpr std::string_view ContentType = "content-type";
inline constexpr std::string_view ContentDisposition = "content-disposition";
inline constexpr std::string_view Cookie = "cookie";
inline constexpr std::string_view Host = "host";
inline constexpr std::string_view Location = "location";
inline constexpr std::string_view Allow = "allow";

// Content types
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view ContentTypeMultipartFormData = "multipart/form-data";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Schemes
inline constexpr std::string_view SchemeHttp = "http";
inline constexpr std::string_view SchemeHttps = "https";
inline constexpr std::string_view SchemeWs = "ws";
inline constexpr std::string_view SchemeWss = "wss";

}  // namespace conduit::http

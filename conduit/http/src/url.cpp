#include "conduit/url.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "conduit/charset.hpp"
#include "conduit/connection-scope.hpp"
#include "conduit/headers-multi-map.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/string-equal-ignore-case.hpp"

namespace conduit {
namespace {

struct HostPort {
  std::string_view host;
  std::optional<uint16_t> port;
};

HostPort SplitHostPort(std::string_view hostHeader) {
  HostPort ret{hostHeader, std::nullopt};
  std::size_t colon;
  if (hostHeader.starts_with('[')) {
    // IPv6 literal
    const auto closing = hostHeader.find(']');
    if (closing == std::string_view::npos) {
      return ret;
    }
    ret.host = hostHeader.substr(0, closing + 1);
    colon = closing + 1 < hostHeader.size() && hostHeader[closing + 1] == ':' ? closing + 1 : std::string_view::npos;
  } else {
    colon = hostHeader.find(':');
    ret.host = hostHeader.substr(0, colon);
  }
  if (colon != std::string_view::npos) {
    const std::string_view portStr = hostHeader.substr(colon + 1);
    uint16_t port{};
    const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
    if (errc == std::errc{} && ptr == portStr.data() + portStr.size()) {
      ret.port = port;
    }
  }
  return ret;
}

}  // namespace

std::optional<uint16_t> DefaultPort(std::string_view scheme) noexcept {
  if (CaseInsensitiveEqual(scheme, http::SchemeHttp) || CaseInsensitiveEqual(scheme, http::SchemeWs)) {
    return 80;
  }
  if (CaseInsensitiveEqual(scheme, http::SchemeHttps) || CaseInsensitiveEqual(scheme, http::SchemeWss)) {
    return 443;
  }
  return std::nullopt;
}

Url Url::FromScope(const ConnectionScope& scope, const HeadersMultiMap& headers) {
  Url url;
  url.scheme = scope.scheme().empty() ? std::string(http::SchemeHttp) : std::string(scope.scheme());

  if (const auto& server = scope.server()) {
    url.host = server->host;
    url.port = server->port;
  }
  if (const auto hostHeader = headers.get(http::Host); hostHeader && !hostHeader->empty()) {
    const HostPort hostPort = SplitHostPort(*hostHeader);
    url.host.assign(hostPort.host);
    if (hostPort.port) {
      url.port = hostPort.port;
    }
  }

  url.path = scope.fullPath();
  url.query = charset::Decode(scope.queryString(), charset::Charset::Latin1);
  return url;
}

bool Url::hasDefaultPort() const noexcept { return !port || port == DefaultPort(scheme); }

std::string Url::str() const {
  std::string ret;
  ret.reserve(scheme.size() + 3U + host.size() + 6U + path.size() + 1U + query.size());
  ret.append(scheme);
  ret.append("://");
  ret.append(host);
  if (!hasDefaultPort()) {
    ret.push_back(':');
    ret.append(std::to_string(*port));
  }
  ret.append(path);
  if (!query.empty()) {
    ret.push_back('?');
    ret.append(query);
  }
  return ret;
}

}  // namespace conduit

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conduit {

class ConnectionScope;
class HeadersMultiMap;

// Absolute URL of a request, rebuilt from the connection scope.
struct Url {
  // Scheme from the scope, host from the 'host' header when present (the transport server host otherwise),
  // port from the 'host' header when it carries one (the transport server port otherwise),
  // path as root path followed by path, and raw query string.
  static Url FromScope(const ConnectionScope& scope, const HeadersMultiMap& headers);

  // Whether 'port' is absent or the default one for 'scheme'.
  [[nodiscard]] bool hasDefaultPort() const noexcept;

  // Full textual form. Default ports are omitted.
  [[nodiscard]] std::string str() const;

  bool operator==(const Url&) const = default;

  std::string scheme;
  std::string host;
  std::optional<uint16_t> port;
  std::string path;
  std::string query;
};

// Default port of a scheme (80 for http / ws, 443 for https / wss), if known.
[[nodiscard]] std::optional<uint16_t> DefaultPort(std::string_view scheme) noexcept;

}  // namespace conduit

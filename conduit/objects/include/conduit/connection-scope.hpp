#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "conduit/raw-header.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/vector.hpp"

namespace conduit {

struct Address {
  std::string host;
  uint16_t port{};

  bool operator==(const Address&) const noexcept = default;
};

class ConnectionScopeBuilder;

// Immutable connection metadata handed over by the transport.
// Instances are only created through ConnectionScopeBuilder and shared read-only.
class ConnectionScope {
 public:
  [[nodiscard]] ScopeType type() const noexcept { return _type; }

  // Request method, always upper case. Empty for lifespan scopes.
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::string_view rootPath() const noexcept { return _rootPath; }

  // rootPath() followed by path(), the path seen by routing.
  [[nodiscard]] std::string fullPath() const;

  [[nodiscard]] std::string_view scheme() const noexcept { return _scheme; }

  [[nodiscard]] std::string_view httpVersion() const noexcept { return _httpVersion; }

  // Raw query bytes, without the leading '?'.
  [[nodiscard]] std::string_view queryString() const noexcept { return _queryString; }

  [[nodiscard]] std::span<const RawHeader> headers() const noexcept { return _headers; }

  [[nodiscard]] const std::optional<Address>& client() const noexcept { return _client; }

  [[nodiscard]] const std::optional<Address>& server() const noexcept { return _server; }

  [[nodiscard]] std::span<const std::string> subprotocols() const noexcept { return _subprotocols; }

 private:
  friend class ConnectionScopeBuilder;

  ConnectionScope() = default;

  ScopeType _type{ScopeType::Http};
  std::string _method;
  std::string _path;
  std::string _rootPath;
  std::string _scheme;
  std::string _httpVersion;
  std::string _queryString;
  vector<RawHeader> _headers;
  std::optional<Address> _client;
  std::optional<Address> _server;
  vector<std::string> _subprotocols;
};

using ConnectionScopePtr = std::shared_ptr<const ConnectionScope>;

class ConnectionScopeBuilder {
 public:
  explicit ConnectionScopeBuilder(ScopeType type = ScopeType::Http);

  ConnectionScopeBuilder& withMethod(std::string_view method);

  ConnectionScopeBuilder& withPath(std::string_view path);

  ConnectionScopeBuilder& withRootPath(std::string_view rootPath);

  // Default: "http" (or "ws" for WebSocket scopes)
  ConnectionScopeBuilder& withScheme(std::string_view scheme);

  ConnectionScopeBuilder& withHttpVersion(std::string_view httpVersion);

  ConnectionScopeBuilder& withQueryString(std::string_view queryString);

  // Appends a header. Order and duplicates are preserved.
  ConnectionScopeBuilder& withHeader(std::string_view name, std::string_view value);

  ConnectionScopeBuilder& withClient(std::string_view host, uint16_t port);

  ConnectionScopeBuilder& withServer(std::string_view host, uint16_t port);

  ConnectionScopeBuilder& withSubprotocol(std::string_view subprotocol);

  // Validates the collected fields and freezes them into a shared immutable scope.
  // Throws std::invalid_argument if an http / websocket scope has a path not starting with '/'.
  [[nodiscard]] ConnectionScopePtr build();

 private:
  ConnectionScope _scope;
};

}  // namespace conduit

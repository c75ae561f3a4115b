#include "conduit/connection-scope.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/http-constants.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/toupperlower.hpp"

namespace conduit {

std::string ConnectionScope::fullPath() const {
  std::string ret;
  ret.reserve(_rootPath.size() + _path.size());
  ret.append(_rootPath);
  ret.append(_path);
  return ret;
}

ConnectionScopeBuilder::ConnectionScopeBuilder(ScopeType type) {
  _scope._type = type;
  if (type != ScopeType::Lifespan) {
    _scope._method = type == ScopeType::Http ? http::GET : std::string_view{};
    _scope._path = "/";
    _scope._scheme = type == ScopeType::WebSocket ? http::SchemeWs : http::SchemeHttp;
    _scope._httpVersion = "1.1";
  }
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withMethod(std::string_view method) {
  _scope._method.assign(method);
  for (char& ch : _scope._method) {
    ch = toupper(ch);
  }
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withPath(std::string_view path) {
  _scope._path.assign(path);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withRootPath(std::string_view rootPath) {
  _scope._rootPath.assign(rootPath);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withScheme(std::string_view scheme) {
  _scope._scheme.assign(scheme);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withHttpVersion(std::string_view httpVersion) {
  _scope._httpVersion.assign(httpVersion);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withQueryString(std::string_view queryString) {
  _scope._queryString.assign(queryString);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withHeader(std::string_view name, std::string_view value) {
  _scope._headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withClient(std::string_view host, uint16_t port) {
  _scope._client.emplace(std::string(host), port);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withServer(std::string_view host, uint16_t port) {
  _scope._server.emplace(std::string(host), port);
  return *this;
}

ConnectionScopeBuilder& ConnectionScopeBuilder::withSubprotocol(std::string_view subprotocol) {
  _scope._subprotocols.emplace_back(subprotocol);
  return *this;
}

ConnectionScopePtr ConnectionScopeBuilder::build() {
  if (_scope._type != ScopeType::Lifespan) {
    if (!_scope._path.starts_with('/')) {
      throw std::invalid_argument("Connection scope path must begin with '/'");
    }
    if (_scope._type == ScopeType::Http && _scope._method.empty()) {
      throw std::invalid_argument("Http connection scope requires a method");
    }
  }
  // ConnectionScope constructor is private, hence no make_shared
  return std::shared_ptr<const ConnectionScope>(new ConnectionScope(std::move(_scope)));
}

}  // namespace conduit

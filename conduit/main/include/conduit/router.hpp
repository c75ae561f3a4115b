#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/request.hpp"
#include "conduit/response.hpp"
#include "conduit/router-config.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Coroutine handler of a route. Only asynchronous handlers are accepted.
using RouteHandler = std::function<Task<HandlerResult>(Request&)>;

struct RouteMatch {
  [[nodiscard]] bool found() const noexcept { return handler != nullptr; }

  // Matched handler, nullptr if no route matched (or if the path matched but not the method).
  const RouteHandler* handler{nullptr};

  // Captured path parameters of the matched route.
  PathParams params;

  // The path matched a route that has no handler for the requested method.
  bool methodNotAllowed{false};
};

class Router {
 public:
  // Token reported by allowedMethods() for routes accepting any method.
  static constexpr std::string_view kAnyMethod = "*";

  Router() noexcept = default;

  // Throws std::invalid_argument if 'config' is invalid.
  explicit Router(RouterConfig config);

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  Router(Router&&) noexcept;
  Router& operator=(Router&&) noexcept;

  ~Router();

  // Register a handler for an absolute path pattern and a set of methods (empty set: any method).
  // Methods are free-form (custom methods such as PROPFIND are allowed) and compared in upper case.
  //
  // Pattern syntax:
  // - "/users/{userId}/posts/{post}" matches "/users/42/posts/foo" with userId=42 and post=foo
  // - "/items/{}/details-{}" matches "/items/123/details-foo" with "0"=123 and "1"=foo
  // - "/files/{{config}}/data" matches the literal path "/files/{config}/data"
  // - "/static/*" matches any path below "/static/", without captures. The wildcard must be terminal.
  // Named and unnamed parameters cannot be mixed in a single pattern.
  //
  // Throws ConfigurationError if 'handler' is empty, std::invalid_argument for a malformed pattern and
  // std::logic_error if the same pattern is registered with different parameter names.
  // Registering an existing (pattern, method) pair replaces its handler.
  void route(std::string_view pattern, std::initializer_list<std::string_view> methods, RouteHandler handler);

  void route(std::string_view pattern, std::string_view method, RouteHandler handler) {
    route(pattern, {method}, std::move(handler));
  }

  // Any method.
  void route(std::string_view pattern, RouteHandler handler) {
    route(pattern, std::initializer_list<std::string_view>{}, std::move(handler));
  }

  // Best match for 'path' and 'method'. Literal segments are preferred to parameter segments, themselves preferred
  // to a terminal wildcard. Never throws on a miss: the returned RouteMatch is then not found().
  [[nodiscard]] RouteMatch match(std::string_view path, std::string_view method) const;

  // Same as match(), but throws MethodNotAllowed if the path matches without a handler for 'method',
  // and RouteNotFound if nothing matches.
  [[nodiscard]] RouteMatch dispatch(std::string_view path, std::string_view method) const;

  // Methods registered for the route matching 'path', in upper case and registration order.
  // A route accepting any method reports kAnyMethod. Empty if no route matches.
  [[nodiscard]] vector<std::string> allowedMethods(std::string_view path) const;

  // Number of route() registrations.
  [[nodiscard]] std::size_t size() const noexcept { return _nbRoutes; }

  [[nodiscard]] bool empty() const noexcept { return _nbRoutes == 0; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Clear all registered routes. The configuration stays unchanged.
  void clear() noexcept;

 private:
  struct SegmentPart {
    enum class Kind : std::uint8_t { Literal, Param };

    [[nodiscard]] Kind kind() const noexcept { return literal.empty() ? Kind::Param : Kind::Literal; }

    bool operator==(const SegmentPart&) const noexcept = default;

    std::string literal;  // non empty when Kind::Literal
  };

  struct CompiledSegment {
    enum class Type : std::uint8_t { Literal, Pattern };

    [[nodiscard]] Type type() const noexcept { return literal.empty() ? Type::Pattern : Type::Literal; }

    bool operator==(const CompiledSegment&) const noexcept = default;

    std::string literal;        // non empty when Type::Literal
    vector<SegmentPart> parts;  // used when Type::Pattern
  };

  struct CompiledRoute {
    vector<CompiledSegment> segments;
    vector<std::string> paramNames;
    bool hasWildcard{false};
  };

  struct MethodHandler {
    std::string method;  // empty for any method
    RouteHandler handler;
  };

  struct RouteEntry {
    [[nodiscard]] const RouteHandler* find(std::string_view method) const noexcept;

    [[nodiscard]] bool hasAnyHandler() const noexcept { return !handlers.empty(); }

    vector<MethodHandler> handlers;
  };

  struct RouteNode;

  struct DynamicEdge {
    CompiledSegment segment;
    std::unique_ptr<RouteNode> child;
  };

  struct RouteNode {
    // Human-readable pattern reconstructed from the compiled route, e.g. "/users/{param}/files/*".
    // Prerequisite: pRoute should not be nullptr.
    [[nodiscard]] std::string patternString() const;

    std::map<std::string, std::unique_ptr<RouteNode>, std::less<>> literalChildren;
    vector<DynamicEdge> dynamicChildren;
    std::unique_ptr<RouteNode> wildcardChild;

    RouteEntry handlersNoSlash;
    RouteEntry handlersWithSlash;
    std::unique_ptr<CompiledRoute> pRoute;
    bool hasNoSlashRegistered{false};
    bool hasWithSlashRegistered{false};
  };

  // Transient buffers of one lookup.
  struct MatchState;

  static CompiledRoute CompilePattern(std::string_view path);

  static RouteNode* EnsureLiteralChild(RouteNode& node, std::string_view segmentLiteral);
  static RouteNode* EnsureDynamicChild(RouteNode& node, const CompiledSegment& segmentPattern);

  static void EnsureRouteMetadata(RouteNode& node, CompiledRoute&& route);

  static bool MatchPatternSegment(const CompiledSegment& segmentPattern, std::string_view segmentValue,
                                  vector<std::string_view>& captures);

  const RouteNode* matchImpl(MatchState& state, bool requestHasTrailingSlash) const;

  static const RouteNode* MatchWithWildcard(const RouteNode& node) noexcept;

  [[nodiscard]] const RouteEntry* computeRouteEntry(const RouteNode& matchedNode, bool pathHasTrailingSlash) const;

  const RouteNode* lookup(std::string_view path, MatchState& state, bool& pathHasTrailingSlash) const;

  RouterConfig _config;
  std::unique_ptr<RouteNode> _pRootRouteNode;
  std::size_t _nbRoutes{0};
};

}  // namespace conduit

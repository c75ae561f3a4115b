#include "conduit/router.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/errors.hpp"
#include "conduit/log.hpp"
#include "conduit/request.hpp"
#include "conduit/router-config.hpp"
#include "conduit/toupperlower.hpp"
#include "conduit/vector.hpp"

namespace conduit {
namespace {

constexpr std::string_view kEscapedOpenBrace = "{{";
constexpr std::string_view kEscapedCloseBrace = "}}";

bool MayNormalizeHasTrailingSlash(RouterConfig::TrailingSlashPolicy policy, std::string_view& path) {
  const bool pathHasTrailingSlash = path.size() > 1U && path.back() == '/';
  if (pathHasTrailingSlash && policy == RouterConfig::TrailingSlashPolicy::Normalize) {
    path.remove_suffix(1U);
  }
  return pathHasTrailingSlash;
}

std::string ToUpperMethod(std::string_view method) {
  std::string ret(method);
  for (char& ch : ret) {
    ch = toupper(ch);
  }
  return ret;
}

void SplitPathSegments(std::string_view path, vector<std::string_view>& segments) {
  segments.clear();

  std::size_t pos = path.front() == '/' ? 1U : 0U;
  while (pos < path.size()) {
    const std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      segments.push_back(path.substr(pos));
      break;
    }
    segments.push_back(path.substr(pos, nextSlash - pos));
    pos = nextSlash + 1U;
  }
}

}  // namespace

struct Router::MatchState {
  struct StackFrame {
    const RouteNode* node;
    uint32_t segmentIndex;
    uint32_t dynamicChildIdx;
    uint32_t captureSize;
  };

  vector<std::string_view> segments;
  vector<std::string_view> captures;
  vector<StackFrame> stack;
};

Router::Router(RouterConfig config) : _config(config) { _config.validate(); }

Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

Router::~Router() = default;

const RouteHandler* Router::RouteEntry::find(std::string_view method) const noexcept {
  const MethodHandler* pAnyMethod = nullptr;
  for (const MethodHandler& methodHandler : handlers) {
    if (methodHandler.method == method) {
      return &methodHandler.handler;
    }
    if (methodHandler.method.empty()) {
      pAnyMethod = &methodHandler;
    }
  }
  return pAnyMethod == nullptr ? nullptr : &pAnyMethod->handler;
}

void Router::route(std::string_view pattern, std::initializer_list<std::string_view> methods, RouteHandler handler) {
  if (!handler) {
    throw ConfigurationError("Cannot set empty RouteHandler");
  }

  const bool pathHasTrailingSlash = MayNormalizeHasTrailingSlash(_config.trailingSlashPolicy, pattern);

  CompiledRoute compiled = CompilePattern(pattern);

  if (!_pRootRouteNode) {
    _pRootRouteNode = std::make_unique<RouteNode>();
  }

  RouteNode* pNode = _pRootRouteNode.get();
  for (const auto& segment : compiled.segments) {
    if (segment.type() == CompiledSegment::Type::Literal) {
      pNode = EnsureLiteralChild(*pNode, segment.literal);
    } else {
      pNode = EnsureDynamicChild(*pNode, segment);
    }
  }

  if (compiled.hasWildcard) {
    if (!pNode->wildcardChild) {
      pNode->wildcardChild = std::make_unique<RouteNode>();
    }
    pNode = pNode->wildcardChild.get();
  }

  EnsureRouteMetadata(*pNode, std::move(compiled));

  // With the Normalize policy, '/p/' and '/p' share the same entry
  const bool withSlash =
      pathHasTrailingSlash && _config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Strict;
  if (withSlash) {
    pNode->hasWithSlashRegistered = true;
  } else {
    pNode->hasNoSlashRegistered = true;
  }
  RouteEntry& entry = withSlash ? pNode->handlersWithSlash : pNode->handlersNoSlash;

  const auto assign = [&entry, pNode](std::string method, const RouteHandler& methodHandler) {
    const auto it = std::ranges::find(entry.handlers, method, &MethodHandler::method);
    if (it != entry.handlers.end()) {
      log::warn("Overwriting existing route handler for {} {}", method.empty() ? kAnyMethod : method,
                pNode->patternString());
      it->handler = methodHandler;
    } else {
      entry.handlers.emplace_back(std::move(method), methodHandler);
    }
  };

  if (methods.size() == 0) {
    assign(std::string{}, handler);
  } else {
    for (std::string_view method : methods) {
      if (method.empty()) {
        throw std::invalid_argument("Route method cannot be empty");
      }
      assign(ToUpperMethod(method), handler);
    }
  }
  ++_nbRoutes;

  log::debug("Registered route {}", pNode->patternString());
}

Router::RouteNode* Router::EnsureLiteralChild(RouteNode& node, std::string_view segmentLiteral) {
  auto it = node.literalChildren.find(segmentLiteral);
  if (it == node.literalChildren.end()) {
    it = node.literalChildren.emplace(std::string(segmentLiteral), std::make_unique<RouteNode>()).first;
  }
  return it->second.get();
}

Router::RouteNode* Router::EnsureDynamicChild(RouteNode& node, const CompiledSegment& segmentPattern) {
  const auto it = std::ranges::find_if(
      node.dynamicChildren, [&segmentPattern](const DynamicEdge& edge) { return edge.segment == segmentPattern; });
  if (it != node.dynamicChildren.end()) {
    return it->child.get();
  }
  return node.dynamicChildren.emplace_back(segmentPattern, std::make_unique<RouteNode>()).child.get();
}

void Router::EnsureRouteMetadata(RouteNode& node, CompiledRoute&& route) {
  if (!node.pRoute) {
    node.pRoute = std::make_unique<CompiledRoute>(std::move(route));
    return;
  }
  if (node.pRoute->paramNames != route.paramNames) {
    throw std::logic_error("Conflicting parameter naming for identical path pattern");
  }
}

bool Router::MatchPatternSegment(const CompiledSegment& segmentPattern, std::string_view segmentValue,
                                 vector<std::string_view>& captures) {
  std::size_t pos = 0;
  for (std::size_t idx = 0; idx < segmentPattern.parts.size(); ++idx) {
    const SegmentPart& part = segmentPattern.parts[idx];
    if (part.kind() == SegmentPart::Kind::Literal) {
      if (!segmentValue.substr(pos).starts_with(part.literal)) {
        return false;
      }
      pos += part.literal.size();
      continue;
    }

    const auto captureStart = pos;
    auto captureEnd = segmentValue.size();
    if (idx + 1 < segmentPattern.parts.size()) {
      // a parameter is always followed by a literal part
      const SegmentPart& next = segmentPattern.parts[idx + 1];
      const std::size_t found = segmentValue.find(next.literal, pos);
      if (found == std::string_view::npos) {
        return false;
      }
      captureEnd = found;
      pos = found;
    } else {
      pos = segmentValue.size();
    }
    if (captureEnd == captureStart) {
      // parameters capture at least one character
      return false;
    }

    captures.push_back(segmentValue.substr(captureStart, captureEnd - captureStart));
  }

  return pos == segmentValue.size();
}

// A terminal wildcard accepts any remaining segments, with or without trailing slash.
const Router::RouteNode* Router::MatchWithWildcard(const RouteNode& node) noexcept { return node.wildcardChild.get(); }

std::string Router::RouteNode::patternString() const {
  static constexpr std::string_view kParam = "{param}";
  static constexpr std::string_view kSlashAsterisk = "/*";

  std::string out;
  for (const auto& seg : pRoute->segments) {
    out.push_back('/');
    out.append(seg.literal.empty() ? kParam : std::string_view(seg.literal));
  }
  if (pRoute->hasWildcard) {
    out.append(kSlashAsterisk);
  } else if (out.empty()) {
    out.push_back('/');
  }
  return out;
}

const Router::RouteNode* Router::matchImpl(MatchState& state, bool requestHasTrailingSlash) const {
  if (!_pRootRouteNode) {
    return nullptr;
  }

  const auto& segments = state.segments;
  auto& captures = state.captures;
  auto& stack = state.stack;

  // DFS
  for (stack.emplace_back(_pRootRouteNode.get(), 0, 0, 0); !stack.empty();) {
    MatchState::StackFrame frame = stack.back();
    stack.pop_back();

    // Terminal: all segments matched
    if (frame.segmentIndex == segments.size()) {
      captures.resize(frame.captureSize);
      if (frame.node->pRoute) {
        if (_config.trailingSlashPolicy != RouterConfig::TrailingSlashPolicy::Strict) {
          return frame.node;
        }
        if (requestHasTrailingSlash ? frame.node->hasWithSlashRegistered : frame.node->hasNoSlashRegistered) {
          return frame.node;
        }
      }
      if (const RouteNode* wildcardMatch = MatchWithWildcard(*frame.node)) {
        return wildcardMatch;
      }
      continue;
    }

    const std::string_view segment = segments[frame.segmentIndex];

    // Try literal child (only on first visit to this frame)
    if (frame.dynamicChildIdx == 0) {
      ++frame.dynamicChildIdx;

      const auto it = frame.node->literalChildren.find(segment);
      if (it != frame.node->literalChildren.end()) {
        // Push current frame back for later retry, then push child frame
        stack.push_back(frame);
        stack.emplace_back(it->second.get(), frame.segmentIndex + 1, 0, static_cast<uint32_t>(captures.size()));
        continue;
      }
    }

    // Try dynamic children
    const auto dynamicCount = static_cast<uint32_t>(frame.node->dynamicChildren.size());
    const uint32_t edgeIdx = frame.dynamicChildIdx - 1;
    if (edgeIdx < dynamicCount) {
      const auto& edge = frame.node->dynamicChildren[edgeIdx];
      ++frame.dynamicChildIdx;

      captures.resize(frame.captureSize);
      if (MatchPatternSegment(edge.segment, segment, captures)) {
        stack.push_back(frame);
        stack.emplace_back(edge.child.get(), frame.segmentIndex + 1, 0, static_cast<uint32_t>(captures.size()));
        continue;
      }
      // This edge didn't match, push frame back to try next edge
      stack.push_back(frame);
      continue;
    }

    // All children exhausted, try wildcard
    captures.resize(frame.captureSize);
    if (const RouteNode* matchedNode = MatchWithWildcard(*frame.node)) {
      return matchedNode;
    }
    // No match found, backtrack (frame already popped)
  }

  return nullptr;
}

const Router::RouteEntry* Router::computeRouteEntry(const RouteNode& matchedNode, bool pathHasTrailingSlash) const {
  if (_config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Strict && pathHasTrailingSlash &&
      !matchedNode.pRoute->hasWildcard) {
    return &matchedNode.handlersWithSlash;
  }
  return &matchedNode.handlersNoSlash;
}

const Router::RouteNode* Router::lookup(std::string_view path, MatchState& state, bool& pathHasTrailingSlash) const {
  if (path.empty()) {
    return nullptr;
  }
  pathHasTrailingSlash = MayNormalizeHasTrailingSlash(_config.trailingSlashPolicy, path);
  SplitPathSegments(path, state.segments);
  return matchImpl(state, pathHasTrailingSlash);
}

RouteMatch Router::match(std::string_view path, std::string_view method) const {
  RouteMatch result;

  MatchState state;
  bool pathHasTrailingSlash = false;
  const RouteNode* pMatchedNode = lookup(path, state, pathHasTrailingSlash);
  if (pMatchedNode == nullptr) {
    return result;
  }

  const RouteEntry* pEntry = computeRouteEntry(*pMatchedNode, pathHasTrailingSlash);
  result.handler = pEntry->find(ToUpperMethod(method));
  if (result.handler == nullptr) {
    result.methodNotAllowed = true;
    return result;
  }

  const auto& paramNames = pMatchedNode->pRoute->paramNames;
  for (std::size_t paramPos = 0; paramPos < paramNames.size() && paramPos < state.captures.size(); ++paramPos) {
    result.params.insert_or_assign(paramNames[paramPos], std::string(state.captures[paramPos]));
  }

  return result;
}

RouteMatch Router::dispatch(std::string_view path, std::string_view method) const {
  RouteMatch result = match(path, method);
  if (result.methodNotAllowed) {
    throw MethodNotAllowed(method, path);
  }
  if (!result.found()) {
    throw RouteNotFound(path);
  }
  return result;
}

vector<std::string> Router::allowedMethods(std::string_view path) const {
  vector<std::string> methods;

  MatchState state;
  bool pathHasTrailingSlash = false;
  const RouteNode* pMatchedNode = lookup(path, state, pathHasTrailingSlash);
  if (pMatchedNode != nullptr) {
    for (const MethodHandler& methodHandler : computeRouteEntry(*pMatchedNode, pathHasTrailingSlash)->handlers) {
      methods.emplace_back(methodHandler.method.empty() ? kAnyMethod : std::string_view(methodHandler.method));
    }
  }
  return methods;
}

Router::CompiledRoute Router::CompilePattern(std::string_view path) {
  if (path.empty() || path.front() != '/') {
    throw std::invalid_argument("Router paths must begin with '/'");
  }

  CompiledRoute route;
  bool sawNamed = false;
  bool sawUnnamed = false;

  uint32_t paramIdx = 0;
  for (std::size_t pos = 1U; pos < path.size();) {
    const std::size_t nextSlash = path.find('/', pos);
    const std::string_view segment =
        nextSlash == std::string_view::npos ? path.substr(pos) : path.substr(pos, nextSlash - pos);

    if (segment.empty()) {
      throw std::invalid_argument("Router path contains empty segment");
    }

    if (segment == "*") {
      if (nextSlash != std::string_view::npos) {
        throw std::invalid_argument("Wildcard segment must be terminal");
      }
      route.hasWildcard = true;
      break;
    }

    CompiledSegment compiledSegment;

    if (!segment.contains('{') && !segment.contains('}')) {
      compiledSegment.literal.assign(segment);
      route.segments.push_back(std::move(compiledSegment));
      if (nextSlash == std::string_view::npos) {
        break;
      }
      pos = nextSlash + 1U;
      continue;
    }

    std::string literalBuffer;
    bool previousWasParam = false;
    bool hasParam = false;

    for (std::size_t i = 0; i < segment.size();) {
      if (segment.compare(i, kEscapedOpenBrace.size(), kEscapedOpenBrace) == 0) {
        literalBuffer.push_back('{');
        i += kEscapedOpenBrace.size();
        continue;
      }
      if (segment.compare(i, kEscapedCloseBrace.size(), kEscapedCloseBrace) == 0) {
        literalBuffer.push_back('}');
        i += kEscapedCloseBrace.size();
        continue;
      }
      if (segment[i] != '{') {
        literalBuffer.push_back(segment[i]);
        ++i;
        continue;
      }

      const std::size_t closePos = segment.find('}', i + 1U);
      if (closePos == std::string_view::npos) {
        throw std::invalid_argument("Unterminated '{' in router pattern");
      }

      if (!literalBuffer.empty()) {
        compiledSegment.parts.push_back(SegmentPart{std::exchange(literalBuffer, {})});
        previousWasParam = false;
      }

      if (previousWasParam) {
        throw std::invalid_argument("Consecutive parameters without separator are not allowed");
      }
      compiledSegment.parts.emplace_back();
      previousWasParam = true;
      hasParam = true;

      const std::string_view paramName = segment.substr(i + 1U, closePos - i - 1U);
      if (paramName.empty()) {
        sawUnnamed = true;
        route.paramNames.push_back(std::to_string(paramIdx));
      } else {
        sawNamed = true;
        route.paramNames.emplace_back(paramName);
      }

      ++paramIdx;

      i = closePos + 1U;
    }

    if (!literalBuffer.empty()) {
      compiledSegment.parts.push_back(SegmentPart{std::move(literalBuffer)});
    }

    if (!hasParam) {
      // only escaped braces
      compiledSegment.literal.clear();
      for (const SegmentPart& part : compiledSegment.parts) {
        compiledSegment.literal.append(part.literal);
      }
      compiledSegment.parts.clear();
    }

    route.segments.push_back(std::move(compiledSegment));

    if (nextSlash == std::string_view::npos) {
      break;
    }
    pos = nextSlash + 1U;
  }

  if (sawNamed && sawUnnamed) {
    throw std::invalid_argument("Cannot mix named and unnamed parameters in a single path pattern");
  }

  return route;
}

void Router::clear() noexcept {
  _pRootRouteNode.reset();
  _nbRoutes = 0;
}

}  // namespace conduit

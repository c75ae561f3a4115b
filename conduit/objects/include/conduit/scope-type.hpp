#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace conduit {

enum class ScopeType : uint8_t { Http = 1 << 0, WebSocket = 1 << 1, Lifespan = 1 << 2 };

using ScopeTypeBmp = uint8_t;

inline constexpr ScopeTypeBmp kAllScopeTypes = 0b111;

constexpr ScopeTypeBmp operator|(ScopeType lhs, ScopeType rhs) noexcept {
  using T = std::underlying_type_t<ScopeType>;
  return static_cast<ScopeTypeBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr ScopeTypeBmp operator|(ScopeTypeBmp lhs, ScopeType rhs) noexcept {
  using T = std::underlying_type_t<ScopeType>;
  return static_cast<ScopeTypeBmp>(lhs | static_cast<T>(rhs));
}

constexpr bool IsScopeTypeSet(ScopeTypeBmp mask, ScopeType type) noexcept {
  return (mask & static_cast<ScopeTypeBmp>(type)) != 0U;
}

constexpr std::string_view ScopeTypeToStr(ScopeType type) noexcept {
  switch (type) {
    case ScopeType::Http:
      return "http";
    case ScopeType::WebSocket:
      return "websocket";
    case ScopeType::Lifespan:
      return "lifespan";
  }
  return "unknown";
}

}  // namespace conduit

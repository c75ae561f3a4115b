#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <utility>

#include "conduit/connection-handler.hpp"

namespace conduit {

// Builds a stage around a given inner handler.
using StageFactory = std::function<ConnectionHandlerPtr(ConnectionHandlerPtr inner)>;

// Wraps 'terminal' with the stages built by 'factories'. The first factory builds the outermost stage.
// Throws ConfigurationError if a factory is empty or builds a null handler.
[[nodiscard]] ConnectionHandlerPtr Compose(ConnectionHandlerPtr terminal, std::span<const StageFactory> factories);

[[nodiscard]] inline ConnectionHandlerPtr Compose(ConnectionHandlerPtr terminal,
                                                  std::initializer_list<StageFactory> factories) {
  return Compose(std::move(terminal), std::span<const StageFactory>(factories.begin(), factories.size()));
}

// Factory building a stage of type S from its inner handler and the given configuration arguments.
template <class S, class... Args>
[[nodiscard]] StageFactory MakeStageFactory(Args... args) {
  return [... args = std::move(args)](ConnectionHandlerPtr inner) -> ConnectionHandlerPtr {
    return std::make_shared<S>(std::move(inner), args...);
  };
}

}  // namespace conduit

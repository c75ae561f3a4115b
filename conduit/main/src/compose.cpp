#include "conduit/compose.hpp"

#include <span>
#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/errors.hpp"

namespace conduit {

ConnectionHandlerPtr Compose(ConnectionHandlerPtr terminal, std::span<const StageFactory> factories) {
  ConnectionHandlerPtr handler = std::move(terminal);
  for (auto it = factories.rbegin(); it != factories.rend(); ++it) {
    if (!*it) {
      throw ConfigurationError("Cannot compose an empty stage factory");
    }
    handler = (*it)(std::move(handler));
    if (!handler) {
      throw ConfigurationError("Stage factory built a null handler");
    }
  }
  return handler;
}

}  // namespace conduit

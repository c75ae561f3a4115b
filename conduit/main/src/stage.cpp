#include "conduit/stage.hpp"

#include <memory>
#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/task.hpp"

namespace conduit {

Stage::Stage(ConnectionHandlerPtr inner, ScopeTypeBmp interests)
    : _inner(inner ? std::move(inner) : std::make_shared<NotFoundHandler>()), _interests(interests) {}

Task<HandlerResult> Stage::handle(Connection& connection) {
  if (intercepts(connection.type())) {
    return process(connection);
  }
  return _inner->handle(connection);
}

}  // namespace conduit

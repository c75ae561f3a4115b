#include "conduit/router-stage.hpp"

#include <optional>
#include <string>
#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/log.hpp"
#include "conduit/request.hpp"
#include "conduit/response.hpp"
#include "conduit/router-config.hpp"
#include "conduit/router.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"

namespace conduit {

RouterStage::RouterStage(ConnectionHandlerPtr inner, RouterConfig config)
    : Stage(std::move(inner), kHttpInterests), _router(std::move(config)) {}

Task<HandlerResult> RouterStage::process(Connection& connection) {
  Request& request = connection.bindRequest();
  const std::string fullPath = connection.scope().fullPath();

  std::optional<RouteMatch> routeMatch;
  try {
    routeMatch = _router.dispatch(fullPath, request.method());
  } catch (const RouteNotFound& ex) {
    log::debug("{}, running default handler", ex.what());
  }

  if (!routeMatch) {
    request.setPathParams({});
    co_return co_await inner().handle(connection);
  }

  log::debug("Dispatching {} {} with {} path parameter(s)", request.method(), fullPath, routeMatch->params.size());
  request.setPathParams(std::move(routeMatch->params));
  // the route table may change while the handler is suspended
  const RouteHandler handler = *routeMatch->handler;
  co_return co_await handler(request);
}

}  // namespace conduit

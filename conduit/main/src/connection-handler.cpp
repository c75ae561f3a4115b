#include "conduit/connection-handler.hpp"

#include <utility>

#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/response.hpp"
#include "conduit/task.hpp"

namespace conduit {

FunctionHandler::FunctionHandler(ConnectionHandlerFn fn) : _fn(std::move(fn)) {
  if (!_fn) {
    throw ConfigurationError("Cannot set empty connection handler");
  }
}

Task<HandlerResult> NotFoundHandler::handle([[maybe_unused]] Connection& connection) {
  co_return Response::Html("Not Found", http::StatusCodeNotFound);
}

}  // namespace conduit

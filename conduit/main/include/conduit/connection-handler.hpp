#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Anything able to handle a connection: a stage of the chain or its terminal handler.
class ConnectionHandler {
 public:
  virtual ~ConnectionHandler() = default;

  virtual Task<HandlerResult> handle(Connection& connection) = 0;
};

using ConnectionHandlerPtr = std::shared_ptr<ConnectionHandler>;

using ConnectionHandlerFn = std::function<Task<HandlerResult>(Connection&)>;

// Adapts a coroutine function into a ConnectionHandler.
class FunctionHandler : public ConnectionHandler {
 public:
  // Throws ConfigurationError if 'fn' is empty.
  explicit FunctionHandler(ConnectionHandlerFn fn);

  Task<HandlerResult> handle(Connection& connection) override { return _fn(connection); }

 private:
  ConnectionHandlerFn _fn;
};

// Terminal handler rendering the fixed HTML 'Not Found' page with status 404.
class NotFoundHandler : public ConnectionHandler {
 public:
  Task<HandlerResult> handle(Connection& connection) override;
};

[[nodiscard]] inline ConnectionHandlerPtr MakeHandler(ConnectionHandlerFn fn) {
  return std::make_shared<FunctionHandler>(std::move(fn));
}

}  // namespace conduit

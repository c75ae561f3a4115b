#pragma once

#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Binds the request facade to the connection, so that every inner stage shares the same cached views.
class RequestStage : public Stage {
 public:
  explicit RequestStage(ConnectionHandlerPtr inner = nullptr) : Stage(std::move(inner), kHttpInterests) {}

 protected:
  Task<HandlerResult> process(Connection& connection) override;
};

}  // namespace conduit

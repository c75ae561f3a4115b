#include "conduit/request-stage.hpp"

#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/task.hpp"

namespace conduit {

Task<HandlerResult> RequestStage::process(Connection& connection) {
  connection.bindRequest();
  return inner().handle(connection);
}

}  // namespace conduit

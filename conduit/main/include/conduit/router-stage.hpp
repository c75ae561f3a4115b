#pragma once

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/response.hpp"
#include "conduit/router-config.hpp"
#include "conduit/router.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Innermost stage: dispatches the bound request to the route matching its full path and method.
// On a miss (unknown path or unregistered method), the inner handler runs instead with empty path parameters.
class RouterStage : public Stage {
 public:
  // A null 'inner' default handler renders the 404 page.
  explicit RouterStage(ConnectionHandlerPtr inner = nullptr, RouterConfig config = {});

  [[nodiscard]] Router& router() noexcept { return _router; }
  [[nodiscard]] const Router& router() const noexcept { return _router; }

 protected:
  Task<HandlerResult> process(Connection& connection) override;

 private:
  Router _router;
};

}  // namespace conduit

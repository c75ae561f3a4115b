#pragma once

#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/response-stage-config.hpp"
#include "conduit/response.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"

namespace conduit {

// Normalizes the inner handler result into a SendableResponse (see NegotiateResponse).
// In send mode, every event of the response is forwarded to the transport and an empty result is returned.
// In prepare mode, the normalized response object is returned as is.
class ResponseStage : public Stage {
 public:
  explicit ResponseStage(ConnectionHandlerPtr inner = nullptr, ResponseStageConfig config = {})
      : Stage(std::move(inner), kHttpInterests), _config(config) {}

  [[nodiscard]] const ResponseStageConfig& config() const noexcept { return _config; }

 protected:
  Task<HandlerResult> process(Connection& connection) override;

 private:
  ResponseStageConfig _config;
};

}  // namespace conduit

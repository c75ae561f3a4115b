#include "conduit/response-stage.hpp"

#include <memory>
#include <optional>
#include <utility>

#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/event.hpp"
#include "conduit/log.hpp"
#include "conduit/response.hpp"
#include "conduit/task.hpp"

namespace conduit {

Task<HandlerResult> ResponseStage::process(Connection& connection) {
  HandlerResult result;
  try {
    result = co_await inner().handle(connection);
  } catch (const HttpError& ex) {
    if (!_config.convertHttpErrors) {
      throw;
    }
    log::warn("Converting HTTP error into a {} response: {}", ex.status(), ex.what());
    result = Response::Text(ex.what(), ex.status());
  }

  std::unique_ptr<SendableResponse> response = NegotiateResponse(std::move(result));
  if (!response) {
    co_return HandlerResult{};
  }
  if (_config.prepareResponseOnly) {
    co_return HandlerResult(std::move(response));
  }
  while (std::optional<Event> event = co_await response->nextMessage()) {
    co_await connection.sendEvent(std::move(*event));
  }
  co_return HandlerResult{};
}

}  // namespace conduit

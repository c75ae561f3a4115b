#include "conduit/lifespan-stage.hpp"

#include <cstddef>
#include <exception>
#include <string_view>
#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/event.hpp"
#include "conduit/internal/lifespan-state.hpp"
#include "conduit/lifespan-config.hpp"
#include "conduit/log.hpp"
#include "conduit/response.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

LifespanStage::LifespanStage(ConnectionHandlerPtr inner, LifespanConfig config)
    : Stage(std::move(inner), static_cast<ScopeTypeBmp>(ScopeType::Lifespan)), _config(std::move(config)) {
  _config.validate();
}

void LifespanStage::add(vector<LifespanCallback>& callbacks, LifespanCallback callback) {
  if (!callback) {
    throw ConfigurationError("Cannot register empty lifespan callback");
  }
  callbacks.push_back(std::move(callback));
}

Task<void> LifespanStage::RunCallbacks(const vector<LifespanCallback>& callbacks, std::string_view phase) {
  for (std::size_t pos = 0; pos < callbacks.size(); ++pos) {
    try {
      co_await callbacks[pos]();
    } catch (const std::exception& ex) {
      log::error("Lifespan {} callback #{} failed: {}", phase, pos, ex.what());
      throw;
    }
  }
}

Task<HandlerResult> LifespanStage::process(Connection& connection) {
  // one state machine per lifespan connection, only the callback registries are shared
  internal::LifespanState state;
  while (true) {
    const Event event = co_await connection.receiveEvent();
    switch (event.type) {
      case EventType::LifespanStartup:
        if (state.isStarted()) {
          log::warn("Lifespan startup received in state {}, running startup callbacks again",
                    internal::LifespanStateToStr(state.state));
        }
        log::debug("Running {} startup callback(s)", _config.startupCallbacks.size());
        co_await RunCallbacks(_config.startupCallbacks, "startup");
        state.enterStarted();
        co_await connection.sendEvent(Event::of(EventType::LifespanStartupComplete));
        break;
      case EventType::LifespanShutdown:
        log::debug("Running {} shutdown callback(s)", _config.shutdownCallbacks.size());
        co_await RunCallbacks(_config.shutdownCallbacks, "shutdown");
        state.enterStopped();
        co_await connection.sendEvent(Event::of(EventType::LifespanShutdownComplete));
        co_return HandlerResult{};
      default:
        log::debug("Ignoring event {} on lifespan connection", EventTypeToStr(event.type));
        break;
    }
  }
}

}  // namespace conduit

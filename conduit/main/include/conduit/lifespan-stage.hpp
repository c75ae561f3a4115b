#pragma once

#include <string_view>
#include <utility>

#include "conduit/connection-handler.hpp"
#include "conduit/connection.hpp"
#include "conduit/errors.hpp"
#include "conduit/lifespan-config.hpp"
#include "conduit/response.hpp"
#include "conduit/stage.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Runs the process lifecycle protocol on lifespan connections:
//   - 'lifespan.startup' : startup callbacks run in registration order, then 'lifespan.startup.complete' is sent.
//   - 'lifespan.shutdown': shutdown callbacks run in registration order, then 'lifespan.shutdown.complete' is sent
//                          and the receive loop ends.
// Each lifespan connection runs its own state machine starting from Idle. A repeated startup signal runs the
// startup callbacks again and is acknowledged, unrelated events are ignored. A failing callback propagates its
// exception: the remaining callbacks of that phase are skipped and no acknowledgement is sent.
// Lifespan connections are never forwarded to the inner handler, other connection types always are.
class LifespanStage : public Stage {
 public:
  explicit LifespanStage(ConnectionHandlerPtr inner = nullptr, LifespanConfig config = {});

  // Registers a startup callback, returning void or Task<void>.
  // Throws ConfigurationError if 'fn' is empty.
  template <class F>
  void onStartup(F&& fn) {
    add(_config.startupCallbacks, MakeLifespanCallback(std::forward<F>(fn)));
  }

  // Registers a shutdown callback, returning void or Task<void>.
  // Throws ConfigurationError if 'fn' is empty.
  template <class F>
  void onShutdown(F&& fn) {
    add(_config.shutdownCallbacks, MakeLifespanCallback(std::forward<F>(fn)));
  }

  [[nodiscard]] const LifespanConfig& config() const noexcept { return _config; }

 protected:
  Task<HandlerResult> process(Connection& connection) override;

 private:
  static void add(vector<LifespanCallback>& callbacks, LifespanCallback callback);

  static Task<void> RunCallbacks(const vector<LifespanCallback>& callbacks, std::string_view phase);

  LifespanConfig _config;
};

}  // namespace conduit

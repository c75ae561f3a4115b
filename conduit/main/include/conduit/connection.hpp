#pragma once

#include <optional>

#include "conduit/connection-scope.hpp"
#include "conduit/event.hpp"
#include "conduit/request.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/task.hpp"
#include "conduit/transport.hpp"

namespace conduit {

// One connection as delivered by the transport: its scope and its receive / send operations.
// The request facade is bound at most once and then shared by every stage of the chain.
class Connection {
 public:
  Connection(ConnectionScopePtr scope, ReceiveFn receive, SendFn send);

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection(Connection&&) noexcept = default;
  Connection& operator=(Connection&&) noexcept = default;

  ~Connection() = default;

  [[nodiscard]] const ConnectionScope& scope() const noexcept { return *_scope; }

  [[nodiscard]] const ConnectionScopePtr& scopePtr() const noexcept { return _scope; }

  [[nodiscard]] ScopeType type() const noexcept { return _scope->type(); }

  [[nodiscard]] const ReceiveFn& receive() const noexcept { return _receive; }

  // Pulls the next event. Throws MissingReceiveError if no receive operation is bound.
  Task<Event> receiveEvent() const;

  // Pushes an event to the transport. Throws std::logic_error if no send operation is bound.
  Task<void> sendEvent(Event event) const;

  // Creates the request facade if needed and returns it. Subsequent calls return the same object.
  Request& bindRequest();

  [[nodiscard]] bool hasRequest() const noexcept { return _request.has_value(); }

  // The bound request facade. Throws std::logic_error if bindRequest() was never called.
  [[nodiscard]] Request& request();

 private:
  ConnectionScopePtr _scope;
  ReceiveFn _receive;
  SendFn _send;
  std::optional<Request> _request;
};

}  // namespace conduit

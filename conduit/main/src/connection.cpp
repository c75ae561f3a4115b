#include "conduit/connection.hpp"

#include <stdexcept>
#include <utility>

#include "conduit/errors.hpp"
#include "conduit/event.hpp"
#include "conduit/request.hpp"
#include "conduit/task.hpp"

namespace conduit {

Connection::Connection(ConnectionScopePtr scope, ReceiveFn receive, SendFn send)
    : _scope(std::move(scope)), _receive(std::move(receive)), _send(std::move(send)) {
  if (!_scope) {
    throw std::invalid_argument("Connection requires a connection scope");
  }
}

Task<Event> Connection::receiveEvent() const {
  if (!_receive) {
    throw MissingReceiveError();
  }
  return _receive();
}

Task<void> Connection::sendEvent(Event event) const {
  if (!_send) {
    throw std::logic_error("No send operation is bound to this connection");
  }
  return _send(std::move(event));
}

Request& Connection::bindRequest() {
  if (!_request) {
    _request.emplace(_scope, _receive, _send);
  }
  return *_request;
}

Request& Connection::request() {
  if (!_request) {
    throw std::logic_error("No request is bound to this connection");
  }
  return *_request;
}

}  // namespace conduit

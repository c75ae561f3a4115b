#pragma once

#include <cstddef>
#include <deque>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/event.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/task.hpp"
#include "conduit/transport.hpp"
#include "conduit/vector.hpp"

namespace conduit::test {

// In-memory transport: replays queued incoming events and records sent ones.
// Once the queue is drained, receive() yields 'http.disconnect', or throws std::out_of_range if
// setThrowWhenDrained(true) was called.
// The receive / send operations reference this object, which must outlive them.
class ScriptedTransport {
 public:
  ScriptedTransport() = default;

  ScriptedTransport(std::initializer_list<Event> incoming) : _incoming(incoming) {}

  ScriptedTransport(const ScriptedTransport&) = delete;
  ScriptedTransport& operator=(const ScriptedTransport&) = delete;

  void push(Event event) { _incoming.push_back(std::move(event)); }

  void setThrowWhenDrained(bool throwWhenDrained) noexcept { _throwWhenDrained = throwWhenDrained; }

  [[nodiscard]] ReceiveFn receiveFn();

  [[nodiscard]] SendFn sendFn();

  [[nodiscard]] const vector<Event>& sent() const noexcept { return _sent; }

  [[nodiscard]] std::size_t receiveCount() const noexcept { return _receiveCount; }

  [[nodiscard]] std::size_t pending() const noexcept { return _incoming.size(); }

  // Body events of the sent sequence, concatenated.
  [[nodiscard]] std::string sentBody() const;

  // Status of the first sent 'http.response.start' event, if any.
  [[nodiscard]] std::optional<http::StatusCode> sentStatus() const;

  // First value of header 'name' on the sent 'http.response.start' event, if any.
  [[nodiscard]] std::optional<std::string_view> sentHeader(std::string_view name) const;

 private:
  friend Task<Event> ReceiveNext(ScriptedTransport& transport);
  friend Task<void> RecordSent(ScriptedTransport& transport, Event event);

  std::deque<Event> _incoming;
  vector<Event> _sent;
  std::size_t _receiveCount{0};
  bool _throwWhenDrained{false};
};

}  // namespace conduit::test

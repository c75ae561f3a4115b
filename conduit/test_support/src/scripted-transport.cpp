#include "conduit/scripted-transport.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/event.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/task.hpp"
#include "conduit/transport.hpp"

namespace conduit::test {

Task<Event> ReceiveNext(ScriptedTransport& transport) {
  ++transport._receiveCount;
  if (transport._incoming.empty()) {
    if (transport._throwWhenDrained) {
      throw std::out_of_range("No more scripted incoming events");
    }
    co_return Event::of(EventType::HttpDisconnect);
  }
  Event event = std::move(transport._incoming.front());
  transport._incoming.pop_front();
  co_return event;
}

Task<void> RecordSent(ScriptedTransport& transport, Event event) {
  transport._sent.push_back(std::move(event));
  co_return;
}

ReceiveFn ScriptedTransport::receiveFn() {
  return [this]() { return ReceiveNext(*this); };
}

SendFn ScriptedTransport::sendFn() {
  return [this](Event event) { return RecordSent(*this, std::move(event)); };
}

std::string ScriptedTransport::sentBody() const {
  std::string body;
  for (const Event& event : _sent) {
    if (event.type == EventType::HttpResponseBody) {
      body.append(event.body);
    }
  }
  return body;
}

std::optional<http::StatusCode> ScriptedTransport::sentStatus() const {
  for (const Event& event : _sent) {
    if (event.type == EventType::HttpResponseStart) {
      return event.status;
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> ScriptedTransport::sentHeader(std::string_view name) const {
  for (const Event& event : _sent) {
    if (event.type != EventType::HttpResponseStart) {
      continue;
    }
    for (const RawHeader& header : event.headers) {
      if (CaseInsensitiveEqual(header.name, name)) {
        return std::string_view(header.value);
      }
    }
    break;
  }
  return std::nullopt;
}

}  // namespace conduit::test

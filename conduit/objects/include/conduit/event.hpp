#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "conduit/http-status-code.hpp"
#include "conduit/raw-header.hpp"
#include "conduit/vector.hpp"

namespace conduit {

enum class EventType : uint8_t {
  HttpRequest,
  HttpDisconnect,
  HttpResponseStart,
  HttpResponseBody,
  WebSocketConnect,
  WebSocketAccept,
  WebSocketReceive,
  WebSocketSend,
  WebSocketDisconnect,
  WebSocketClose,
  LifespanStartup,
  LifespanStartupComplete,
  LifespanShutdown,
  LifespanShutdownComplete,
};

// Wire name of the event type, e.g. "http.response.start".
[[nodiscard]] std::string_view EventTypeToStr(EventType type) noexcept;

[[nodiscard]] std::optional<EventType> EventTypeFromStr(std::string_view str) noexcept;

// A message exchanged with the transport, in either direction.
// Only the fields relevant to 'type' are meaningful:
//   - HttpRequest / HttpResponseBody : body, moreBody
//   - HttpResponseStart              : status, headers
//   - WebSocketReceive / Send        : body (bytes) or text
//   - WebSocketClose / Disconnect    : status (close code)
struct Event {
  [[nodiscard]] static Event of(EventType type);

  [[nodiscard]] static Event request(std::string_view body, bool moreBody = false);

  [[nodiscard]] static Event responseStart(http::StatusCode status, vector<RawHeader> headers);

  [[nodiscard]] static Event responseBody(std::string_view body, bool moreBody = false);

  bool operator==(const Event&) const = default;

  EventType type{EventType::HttpRequest};
  http::StatusCode status{};
  bool moreBody{false};
  vector<RawHeader> headers;
  std::string body;
  std::string text;
};

}  // namespace conduit

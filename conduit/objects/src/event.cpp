#include "conduit/event.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "conduit/http-status-code.hpp"
#include "conduit/raw-header.hpp"
#include "conduit/vector.hpp"

namespace conduit {
namespace {

constexpr std::array<std::string_view, 14> kEventTypeStrings{
    "http.request",
    "http.disconnect",
    "http.response.start",
    "http.response.body",
    "websocket.connect",
    "websocket.accept",
    "websocket.receive",
    "websocket.send",
    "websocket.disconnect",
    "websocket.close",
    "lifespan.startup",
    "lifespan.startup.complete",
    "lifespan.shutdown",
    "lifespan.shutdown.complete",
};

static_assert(static_cast<std::size_t>(EventType::LifespanShutdownComplete) + 1U == kEventTypeStrings.size());

}  // namespace

std::string_view EventTypeToStr(EventType type) noexcept { return kEventTypeStrings[static_cast<std::size_t>(type)]; }

std::optional<EventType> EventTypeFromStr(std::string_view str) noexcept {
  for (std::size_t idx = 0; idx < kEventTypeStrings.size(); ++idx) {
    if (kEventTypeStrings[idx] == str) {
      return static_cast<EventType>(idx);
    }
  }
  return std::nullopt;
}

Event Event::of(EventType type) {
  Event event;
  event.type = type;
  return event;
}

Event Event::request(std::string_view body, bool moreBody) {
  Event event = of(EventType::HttpRequest);
  event.body.assign(body);
  event.moreBody = moreBody;
  return event;
}

Event Event::responseStart(http::StatusCode status, vector<RawHeader> headers) {
  Event event = of(EventType::HttpResponseStart);
  event.status = status;
  event.headers = std::move(headers);
  return event;
}

Event Event::responseBody(std::string_view body, bool moreBody) {
  Event event = of(EventType::HttpResponseBody);
  event.body.assign(body);
  event.moreBody = moreBody;
  return event;
}

}  // namespace conduit

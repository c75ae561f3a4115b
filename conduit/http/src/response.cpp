#include "conduit/response.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "conduit/event.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/json.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {
namespace {

constexpr std::string_view kTextPlainUtf8 = "text/plain; charset=utf-8";
constexpr std::string_view kTextHtmlUtf8 = "text/html; charset=utf-8";

}  // namespace

Response::Response(std::string body, std::string_view contentType, http::StatusCode status) : _status(status) {
  this->body(std::move(body), contentType);
}

Response Response::Json(const JsonValue& value, http::StatusCode status) {
  return Response(SerializeToJson(value), http::ContentTypeApplicationJson, status);
}

Response Response::Text(std::string_view text, http::StatusCode status) {
  return Response(std::string(text), kTextPlainUtf8, status);
}

Response Response::Html(std::string_view html, http::StatusCode status) {
  return Response(std::string(html), kTextHtmlUtf8, status);
}

Response Response::Redirect(std::string_view location, http::StatusCode status) {
  return Response(status).header(http::Location, location);
}

std::optional<std::string_view> Response::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const RawHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

Response& Response::header(std::string_view name, std::string_view value) & {
  const auto it =
      std::ranges::find_if(_headers, [name](const RawHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  return *this;
}

Response& Response::addHeader(std::string_view name, std::string_view value) & {
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

Response& Response::body(std::string body, std::string_view contentType) & {
  _body = std::move(body);
  if (!contentType.empty()) {
    header(http::ContentType, contentType);
  }
  return *this;
}

Event Response::startMessage() const {
  vector<RawHeader> headers;
  headers.reserve(_headers.size() + 1U);
  for (const RawHeader& header : _headers) {
    if (!CaseInsensitiveEqual(header.name, http::ContentLength)) {
      headers.push_back(header);
    }
  }
  headers.emplace_back(std::string(http::ContentLength), std::to_string(_body.size()));
  return Event::responseStart(_status, std::move(headers));
}

Task<std::optional<Event>> Response::nextMessage() {
  switch (_stage) {
    case Stage::Start:
      _stage = Stage::Body;
      co_return startMessage();
    case Stage::Body:
      _stage = Stage::Done;
      co_return bodyMessage();
    case Stage::Done:
      break;
  }
  co_return std::nullopt;
}

std::unique_ptr<SendableResponse> NegotiateResponse(HandlerResult result) {
  return std::visit(
      [](auto&& value) -> std::unique_ptr<SendableResponse> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, Response>) {
          return std::make_unique<Response>(std::move(value));
        } else if constexpr (std::is_same_v<T, std::unique_ptr<SendableResponse>>) {
          return std::move(value);
        } else if constexpr (std::is_same_v<T, JsonValue>) {
          return std::make_unique<Response>(Response::Json(value));
        } else if constexpr (std::is_same_v<T, std::string>) {
          return std::make_unique<Response>(Response::Text(value));
        } else {
          static_assert(false, "Non-exhaustive visitor!");
        }
      },
      std::move(result));
}

}  // namespace conduit

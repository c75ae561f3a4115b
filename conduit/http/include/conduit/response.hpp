#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "conduit/event.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/json.hpp"
#include "conduit/raw-header.hpp"
#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Anything able to produce a finite, ordered sequence of send events, pulled one at a time.
class SendableResponse {
 public:
  virtual ~SendableResponse() = default;

  // Next event to send, std::nullopt once the sequence is exhausted.
  virtual Task<std::optional<Event>> nextMessage() = 0;
};

// In-memory response: one 'http.response.start' event followed by a single 'http.response.body' event.
// A 'content-length' header is always emitted.
class Response : public SendableResponse {
 public:
  explicit Response(http::StatusCode status = http::StatusCodeOK) noexcept : _status(status) {}

  Response(std::string body, std::string_view contentType, http::StatusCode status = http::StatusCodeOK);

  // JSON serialized body, 'application/json' content type.
  static Response Json(const JsonValue& value, http::StatusCode status = http::StatusCodeOK);

  // 'text/plain; charset=utf-8' body.
  static Response Text(std::string_view text, http::StatusCode status = http::StatusCodeOK);

  // 'text/html; charset=utf-8' body.
  static Response Html(std::string_view html, http::StatusCode status = http::StatusCodeOK);

  // Empty body with a 'location' header.
  static Response Redirect(std::string_view location, http::StatusCode status = http::StatusCodeTemporaryRedirect);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Headers as set by the user, without the computed 'content-length'.
  [[nodiscard]] const vector<RawHeader>& headers() const noexcept { return _headers; }

  // First value of header 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  Response& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  Response&& status(http::StatusCode statusCode) && noexcept { return std::move(status(statusCode)); }

  // Sets a header, replacing any existing header of the same name.
  Response& header(std::string_view name, std::string_view value) &;

  Response&& header(std::string_view name, std::string_view value) && { return std::move(header(name, value)); }

  // Appends a header, keeping existing ones with the same name.
  Response& addHeader(std::string_view name, std::string_view value) &;

  Response&& addHeader(std::string_view name, std::string_view value) && { return std::move(addHeader(name, value)); }

  // Sets the body, and the content type when 'contentType' is not empty.
  Response& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) &;

  Response&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    return std::move(this->body(std::move(body), contentType));
  }

  // The 'http.response.start' event of this response.
  [[nodiscard]] Event startMessage() const;

  // The 'http.response.body' event of this response.
  [[nodiscard]] Event bodyMessage() const { return Event::responseBody(_body); }

  Task<std::optional<Event>> nextMessage() override;

 private:
  enum class Stage : uint8_t { Start, Body, Done };

  http::StatusCode _status;
  Stage _stage{Stage::Start};
  vector<RawHeader> _headers;
  std::string _body;
};

// Result of a connection handler.
//   - std::monostate      : nothing to send
//   - Response            : sent as is
//   - SendableResponse    : custom event producer
//   - JsonValue           : JSON body, status 200, 'application/json'
//   - std::string         : text body, status 200, 'text/plain'
using HandlerResult = std::variant<std::monostate, Response, std::unique_ptr<SendableResponse>, JsonValue, std::string>;

// Normalize a handler result into its canonical sendable form. Returns nullptr for an empty result.
[[nodiscard]] std::unique_ptr<SendableResponse> NegotiateResponse(HandlerResult result);

}  // namespace conduit

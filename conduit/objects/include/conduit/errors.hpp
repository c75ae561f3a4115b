#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "conduit/http-status-code.hpp"

namespace conduit {

// An error carrying the HTTP status it should be rendered with.
class HttpError : public std::runtime_error {
 public:
  HttpError(http::StatusCode status, const std::string& message) : std::runtime_error(message), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  http::StatusCode _status;
};

enum class DecodeTarget : uint8_t { Text, Json, Form };

[[nodiscard]] std::string_view DecodeTargetToStr(DecodeTarget target) noexcept;

// Raised by explicit request body decoding (text, json, form), never by buffering.
class DecodeError : public HttpError {
 public:
  explicit DecodeError(DecodeTarget target);

  [[nodiscard]] DecodeTarget target() const noexcept { return _target; }

 private:
  DecodeTarget _target;
};

// Invalid setup detected at registration or assembly time.
class ConfigurationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Raised when the body stream is consumed on a facade without a receive operation.
class MissingReceiveError : public std::logic_error {
 public:
  MissingReceiveError() : std::logic_error("No receive operation is bound to this request") {}
};

// No route matches the requested path.
class RouteNotFound : public HttpError {
 public:
  explicit RouteNotFound(std::string_view path);

 protected:
  RouteNotFound(http::StatusCode status, const std::string& message) : HttpError(status, message) {}
};

// A route matches the path but not the method.
class MethodNotAllowed : public RouteNotFound {
 public:
  MethodNotAllowed(std::string_view method, std::string_view path);
};

}  // namespace conduit

#include "conduit/errors.hpp"

#include <string>
#include <string_view>

#include "conduit/http-status-code.hpp"

namespace conduit {

std::string_view DecodeTargetToStr(DecodeTarget target) noexcept {
  switch (target) {
    case DecodeTarget::Text:
      return "Invalid Encoding";
    case DecodeTarget::Json:
      return "Invalid JSON";
    case DecodeTarget::Form:
      return "Invalid Form Data";
  }
  return "Invalid Data";
}

DecodeError::DecodeError(DecodeTarget target)
    : HttpError(http::StatusCodeBadRequest, std::string(DecodeTargetToStr(target))), _target(target) {}

RouteNotFound::RouteNotFound(std::string_view path)
    : HttpError(http::StatusCodeNotFound, std::string("No route for path '") + std::string(path) + "'") {}

MethodNotAllowed::MethodNotAllowed(std::string_view method, std::string_view path)
    : RouteNotFound(http::StatusCodeMethodNotAllowed,
                    std::string("Method ") + std::string(method) + " not allowed for path '" + std::string(path) + "'") {}

}  // namespace conduit

#pragma once

#include <cstdint>

namespace conduit::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeSeeOther = 303;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeUnauthorized = 401;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;
inline constexpr StatusCode StatusCodeUnprocessableEntity = 422;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

constexpr bool IsValidStatusCode(StatusCode statusCode) noexcept { return statusCode >= 100 && statusCode <= 599; }

}  // namespace conduit::http

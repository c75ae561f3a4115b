#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "conduit/connection-scope.hpp"
#include "conduit/cookies.hpp"
#include "conduit/form-data.hpp"
#include "conduit/headers-multi-map.hpp"
#include "conduit/json.hpp"
#include "conduit/options-header.hpp"
#include "conduit/scope-type.hpp"
#include "conduit/task.hpp"
#include "conduit/transport.hpp"
#include "conduit/url.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Router-assigned path parameters, kept apart from the transport scope.
using PathParams = std::map<std::string, std::string, std::less<>>;

// Decoded body as returned by Request::data().
using RequestData =
    std::variant<std::string_view, std::reference_wrapper<const JsonValue>, std::reference_wrapper<const FormData>>;

// Lazily decoding view over one connection.
//
// Every derived view is computed on first access and cached for the lifetime of this object, so repeated
// accesses return the same object (same address) without decoding again. The body stream is drained at most once.
// Synchronous views never fail. Body decoding (text, json, form) reports failures as DecodeError.
//
// Returned references and views stay valid as long as the Request is alive.
class Request {
 public:
  explicit Request(ConnectionScopePtr scope, ReceiveFn receive = {}, SendFn send = {});

  Request(const Request&) = delete;
  Request& operator=(const Request&) = delete;

  Request(Request&&) noexcept = default;
  Request& operator=(Request&&) noexcept = default;

  ~Request() = default;

  [[nodiscard]] const ConnectionScope& scope() const noexcept { return *_scope; }

  [[nodiscard]] ScopeType type() const noexcept { return _scope->type(); }

  [[nodiscard]] std::string_view method() const noexcept { return _scope->method(); }

  [[nodiscard]] std::string_view path() const noexcept { return _scope->path(); }

  [[nodiscard]] const HeadersMultiMap& headers() const;

  [[nodiscard]] const Url& url() const;

  [[nodiscard]] const Cookies& cookies() const;

  // Parsed query string parameters, blank values kept.
  [[nodiscard]] const FormData& query() const;

  // Parsed 'content-type' header.
  [[nodiscard]] const OptionsHeader& contentTypeHeader() const;

  // Primary 'content-type' value, without parameters.
  [[nodiscard]] std::string_view contentType() const { return contentTypeHeader().value; }

  // Parameters of 'content-type'.
  [[nodiscard]] const vector<HeaderOption>& contentTypeOptions() const { return contentTypeHeader().options; }

  // 'charset' parameter of 'content-type', "utf-8" when absent.
  [[nodiscard]] std::string_view charset() const;

  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  void setPathParams(PathParams pathParams) { _pathParams = std::move(pathParams); }

  [[nodiscard]] bool hasReceive() const noexcept { return static_cast<bool>(_receive); }

  [[nodiscard]] const SendFn& send() const noexcept { return _send; }

  // Full body, concatenating request chunks until one without 'moreBody'.
  // Fails with MissingReceiveError if no receive operation was given.
  Task<std::string_view> body();

  // Body decoded with charset() into UTF-8. DecodeError(Text) on invalid bytes or unknown charset.
  Task<std::string_view> text();

  // Body parsed as JSON. DecodeError(Json) on any failure.
  Task<const JsonValue&> json();

  // Multipart or url-encoded form body. DecodeError(Form) on any failure.
  Task<const FormData&> form();

  // json() for 'application/json', form() for form content types, text() otherwise.
  Task<RequestData> data();

 private:
  struct Cache {
    std::optional<HeadersMultiMap> headers;
    std::optional<Url> url;
    std::optional<Cookies> cookies;
    std::optional<FormData> query;
    std::optional<OptionsHeader> contentType;
    std::optional<std::string> text;
    std::optional<JsonValue> json;
    std::optional<FormData> form;
  };

  FormData parseForm(std::string_view rawBody) const;

  ConnectionScopePtr _scope;
  ReceiveFn _receive;
  SendFn _send;
  PathParams _pathParams;
  std::optional<std::string> _body;
  mutable Cache _cache;
};

}  // namespace conduit

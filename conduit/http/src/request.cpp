#include "conduit/request.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "conduit/charset.hpp"
#include "conduit/connection-scope.hpp"
#include "conduit/cookies.hpp"
#include "conduit/errors.hpp"
#include "conduit/event.hpp"
#include "conduit/form-data.hpp"
#include "conduit/headers-multi-map.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/json.hpp"
#include "conduit/log.hpp"
#include "conduit/multipart-form-data.hpp"
#include "conduit/options-header.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/task.hpp"
#include "conduit/url.hpp"

namespace conduit {

Request::Request(ConnectionScopePtr scope, ReceiveFn receive, SendFn send)
    : _scope(std::move(scope)), _receive(std::move(receive)), _send(std::move(send)) {
  if (!_scope) {
    throw std::invalid_argument("Request requires a connection scope");
  }
}

const HeadersMultiMap& Request::headers() const {
  if (!_cache.headers) {
    _cache.headers = HeadersMultiMap::FromRaw(_scope->headers());
  }
  return *_cache.headers;
}

const Url& Request::url() const {
  if (!_cache.url) {
    _cache.url = Url::FromScope(*_scope, headers());
  }
  return *_cache.url;
}

const Cookies& Request::cookies() const {
  if (!_cache.cookies) {
    std::string joined;
    for (std::string_view cookieHeader : headers().getAll(http::Cookie)) {
      if (!joined.empty()) {
        joined.append("; ");
      }
      joined.append(cookieHeader);
    }
    _cache.cookies = ParseCookies(joined);
  }
  return *_cache.cookies;
}

const FormData& Request::query() const {
  if (!_cache.query) {
    _cache.query = ParseUrlEncoded(url().query);
  }
  return *_cache.query;
}

const OptionsHeader& Request::contentTypeHeader() const {
  if (!_cache.contentType) {
    _cache.contentType = ParseOptionsHeader(headers().getOrEmpty(http::ContentType));
  }
  return *_cache.contentType;
}

std::string_view Request::charset() const {
  const auto charsetOption = contentTypeHeader().option("charset");
  if (!charsetOption || charsetOption->empty()) {
    return charset::kDefaultCharset;
  }
  return *charsetOption;
}

Task<std::string_view> Request::body() {
  if (!_body) {
    if (!_receive) {
      throw MissingReceiveError();
    }
    std::string buffer;
    while (true) {
      Event event = co_await _receive();
      if (event.type == EventType::HttpDisconnect) {
        log::debug("Client disconnected while reading body of {} {}", method(), path());
        break;
      }
      buffer.append(event.body);
      if (!event.moreBody) {
        break;
      }
    }
    _body = std::move(buffer);
  }
  co_return *_body;
}

Task<std::string_view> Request::text() {
  if (!_cache.text) {
    const std::string_view raw = co_await body();
    try {
      _cache.text = charset::Decode(raw, charset());
    } catch (const std::invalid_argument& ex) {
      log::debug("Cannot decode request body: {}", ex.what());
      throw DecodeError(DecodeTarget::Text);
    }
  }
  co_return *_cache.text;
}

Task<const JsonValue&> Request::json() {
  if (!_cache.json) {
    try {
      co_await text();
    } catch (const DecodeError&) {
      throw DecodeError(DecodeTarget::Json);
    }
    JsonValue value;
    if (const auto ec = glz::read_json(value, *_cache.text)) {
      log::debug("Cannot parse request JSON: {}", glz::format_error(ec, *_cache.text));
      throw DecodeError(DecodeTarget::Json);
    }
    _cache.json = std::move(value);
  }
  co_return *_cache.json;
}

Task<const FormData&> Request::form() {
  if (!_cache.form) {
    const std::string_view raw = co_await body();
    _cache.form = parseForm(raw);
  }
  co_return *_cache.form;
}

FormData Request::parseForm(std::string_view rawBody) const {
  const auto bodyCharset = charset::FromName(charset());
  if (!bodyCharset) {
    log::debug("Unsupported form charset {}", charset());
    throw DecodeError(DecodeTarget::Form);
  }

  const OptionsHeader& contentTypeHdr = contentTypeHeader();
  try {
    if (CaseInsensitiveEqual(contentTypeHdr.value, http::ContentTypeMultipartFormData)) {
      const MultipartFormData multipart(contentTypeHdr.option("boundary").value_or(std::string_view{}), rawBody);
      if (!multipart.valid()) {
        log::debug("Invalid multipart body: {}", multipart.invalidReason());
        throw DecodeError(DecodeTarget::Form);
      }
      FormData form;
      for (const auto& part : multipart.parts()) {
        FormField field;
        field.name = part.name;
        // file contents are kept as raw bytes
        field.value = part.filename ? std::string(part.value) : charset::Decode(part.value, *bodyCharset);
        field.filename = part.filename;
        if (part.contentType) {
          field.contentType.emplace(*part.contentType);
        }
        form.append(std::move(field));
      }
      return form;
    }
    return ParseUrlEncoded(charset::Decode(rawBody, *bodyCharset), *bodyCharset);
  } catch (const std::invalid_argument& ex) {
    log::debug("Cannot decode form body: {}", ex.what());
    throw DecodeError(DecodeTarget::Form);
  }
}

Task<RequestData> Request::data() {
  const std::string_view contentTypeValue = contentType();
  if (CaseInsensitiveEqual(contentTypeValue, http::ContentTypeApplicationJson)) {
    co_return RequestData(std::in_place_index<1>, co_await json());
  }
  if (CaseInsensitiveEqual(contentTypeValue, http::ContentTypeFormUrlEncoded) ||
      CaseInsensitiveEqual(contentTypeValue, http::ContentTypeMultipartFormData)) {
    co_return RequestData(std::in_place_index<2>, co_await form());
  }
  co_return RequestData(std::in_place_index<0>, co_await text());
}

}  // namespace conduit

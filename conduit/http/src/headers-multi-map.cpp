#include "conduit/headers-multi-map.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "conduit/charset.hpp"
#include "conduit/raw-header.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/vector.hpp"

namespace conduit {

HeadersMultiMap HeadersMultiMap::FromRaw(std::span<const RawHeader> rawHeaders) {
  HeadersMultiMap headers;
  headers._entries.reserve(static_cast<decltype(headers._entries)::size_type>(rawHeaders.size()));
  for (const RawHeader& header : rawHeaders) {
    headers._entries.emplace_back(charset::Decode(header.name, charset::Charset::Latin1),
                                  charset::Decode(header.value, charset::Charset::Latin1));
  }
  return headers;
}

void HeadersMultiMap::append(std::string_view name, std::string_view value) {
  _entries.emplace_back(std::string(name), std::string(value));
}

std::optional<std::string_view> HeadersMultiMap::get(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
  if (it == _entries.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

vector<std::string_view> HeadersMultiMap::getAll(std::string_view name) const {
  vector<std::string_view> values;
  for (const Entry& entry : _entries) {
    if (CaseInsensitiveEqual(entry.name, name)) {
      values.emplace_back(entry.value);
    }
  }
  return values;
}

std::size_t HeadersMultiMap::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); }));
}

}  // namespace conduit

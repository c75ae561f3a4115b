#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "conduit/raw-header.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Ordered multi-value header mapping with case-insensitive name lookups.
// Duplicate names are kept, in arrival order.
class HeadersMultiMap {
 public:
  struct Entry {
    std::string name;
    std::string value;
  };

  using const_iterator = vector<Entry>::const_iterator;

  HeadersMultiMap() noexcept = default;

  // Build from transport headers. Bytes are interpreted as ISO-8859-1 and stored as UTF-8.
  static HeadersMultiMap FromRaw(std::span<const RawHeader> rawHeaders);

  void append(std::string_view name, std::string_view value);

  // First value for 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view getOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  // All values for 'name', in arrival order.
  [[nodiscard]] vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }
  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

 private:
  vector<Entry> _entries;
};

}  // namespace conduit

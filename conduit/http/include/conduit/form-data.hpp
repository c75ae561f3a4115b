#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/charset.hpp"
#include "conduit/vector.hpp"

namespace conduit {

struct FormField {
  std::string name;
  std::string value;
  // Only set for multipart file parts.
  std::optional<std::string> filename;
  std::optional<std::string> contentType;

  bool operator==(const FormField&) const = default;
};

// Ordered multi-value mapping of decoded form fields (or query parameters). Lookups are case-sensitive.
class FormData {
 public:
  using const_iterator = vector<FormField>::const_iterator;

  void append(FormField field) { _fields.push_back(std::move(field)); }

  void append(std::string_view name, std::string_view value);

  // First field named 'name', or nullptr.
  [[nodiscard]] const FormField* field(std::string_view name) const noexcept;

  // Value of the first field named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return field(name) != nullptr; }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }
  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

 private:
  vector<FormField> _fields;
};

// Parse 'application/x-www-form-urlencoded' text: '&' separated pairs, '+' as space, percent-decoded bytes
// interpreted in 'charset' (invalid sequences replaced). Pairs without '=' and blank values are kept with an empty
// value, empty pairs are skipped.
[[nodiscard]] FormData ParseUrlEncoded(std::string_view text, charset::Charset charset = charset::Charset::Utf8);

// Percent-decode 'encoded', decoding escaped byte runs in 'charset'. Unescaped characters are copied unchanged.
[[nodiscard]] std::string UnquoteWithCharset(std::string_view encoded, charset::Charset charset, bool plusAsSpace);

}  // namespace conduit

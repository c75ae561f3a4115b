#include "conduit/form-data.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "conduit/char-hexadecimal-converter.hpp"
#include "conduit/charset.hpp"
#include "conduit/vector.hpp"

namespace conduit {

void FormData::append(std::string_view name, std::string_view value) {
  _fields.emplace_back(std::string(name), std::string(value), std::nullopt, std::nullopt);
}

const FormField* FormData::field(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_fields, [name](const FormField& field) { return field.name == name; });
  return it == _fields.end() ? nullptr : &*it;
}

std::optional<std::string_view> FormData::get(std::string_view name) const noexcept {
  const FormField* pField = field(name);
  if (pField == nullptr) {
    return std::nullopt;
  }
  return std::string_view(pField->value);
}

vector<std::string_view> FormData::getAll(std::string_view name) const {
  vector<std::string_view> values;
  for (const FormField& field : _fields) {
    if (field.name == name) {
      values.emplace_back(field.value);
    }
  }
  return values;
}

std::string UnquoteWithCharset(std::string_view encoded, charset::Charset charset, bool plusAsSpace) {
  std::string ret;
  ret.reserve(encoded.size());
  std::string pendingBytes;
  const auto flushPending = [&]() {
    if (!pendingBytes.empty()) {
      ret.append(charset::Decode(pendingBytes, charset, charset::ErrorMode::Replace));
      pendingBytes.clear();
    }
  };
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch == '%' && pos + 2 < encoded.size() && from_hex_digit(encoded[pos + 1]) >= 0 &&
        from_hex_digit(encoded[pos + 2]) >= 0) {
      pendingBytes.push_back(
          static_cast<char>((from_hex_digit(encoded[pos + 1]) << 4) | from_hex_digit(encoded[pos + 2])));
      pos += 2;
      continue;
    }
    flushPending();
    ret.push_back(plusAsSpace && ch == '+' ? ' ' : ch);
  }
  flushPending();
  return ret;
}

FormData ParseUrlEncoded(std::string_view text, charset::Charset charset) {
  FormData form;
  while (!text.empty()) {
    const auto amp = text.find('&');
    const std::string_view pair = text.substr(0, amp);
    text = amp == std::string_view::npos ? std::string_view{} : text.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }
    const auto eq = pair.find('=');
    const std::string_view name = pair.substr(0, eq);
    const std::string_view value = eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
    form.append(FormField{UnquoteWithCharset(name, charset, true), UnquoteWithCharset(value, charset, true),
                          std::nullopt, std::nullopt});
  }
  return form;
}

}  // namespace conduit

#include "conduit/options-header.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/charset.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/string-trim.hpp"
#include "conduit/url-decode.hpp"
#include "conduit/vector.hpp"

namespace conduit {
namespace {

constexpr bool IsSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\f' || ch == '\v';
}

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

// Scanner over the parameters part of a structured header.
class OptionsScanner {
 public:
  explicit OptionsScanner(std::string_view rest) noexcept : _rest(rest) {}

  struct Fragment {
    std::string_view key;
    std::optional<std::string_view> value;
    std::optional<std::string_view> encoding;
    std::optional<std::size_t> count;
  };

  [[nodiscard]] bool atEnd() const noexcept { return _pos >= _rest.size(); }

  // Returns std::nullopt when the next fragment cannot be parsed.
  std::optional<Fragment> next() {
    Fragment fragment;

    skipSpaces();
    if (peek(',')) {
      ++_pos;
    }
    skipSpaces();

    const auto key = peek('"') ? quoted() : token("; ,=*");
    if (!key) {
      return std::nullopt;
    }
    fragment.key = *key;

    if (peek('*') && _pos + 1 < _rest.size() && IsDigit(_rest[_pos + 1])) {
      ++_pos;
      std::size_t count = 0;
      for (; !atEnd() && IsDigit(_rest[_pos]); ++_pos) {
        count = (count * 10U) + static_cast<std::size_t>(_rest[_pos] - '0');
      }
      fragment.count = count;
    }

    skipSpaces();

    const std::size_t beforeValue = _pos;
    bool hasValuePart = false;
    if (peek('*')) {
      ++_pos;
      skipSpaces();
      if (peek('=')) {
        ++_pos;
        skipSpaces();
        hasValuePart = true;
        extendedPrefix(fragment);
      } else {
        _pos = beforeValue;
      }
    } else if (peek('=')) {
      ++_pos;
      skipSpaces();
      hasValuePart = true;
    }

    if (hasValuePart) {
      if (peek('"')) {
        const std::size_t quoteStart = _pos;
        if (auto value = quoted()) {
          fragment.value = *value;
        } else {
          _pos = quoteStart;
          fragment.value = token(";,");
        }
      } else {
        fragment.value = token(";,");
      }
    }

    skipSpaces();
    if (peek(';')) {
      ++_pos;
    }
    return fragment;
  }

 private:
  [[nodiscard]] bool peek(char ch) const noexcept { return !atEnd() && _rest[_pos] == ch; }

  void skipSpaces() noexcept {
    while (!atEnd() && IsSpace(_rest[_pos])) {
      ++_pos;
    }
  }

  // Non-empty run of characters not in 'stopChars' (whitespace stops too, except for value tokens).
  std::optional<std::string_view> token(std::string_view stopChars) noexcept {
    const bool stopOnSpace = stopChars.contains(' ');
    const std::size_t start = _pos;
    while (!atEnd() && !stopChars.contains(_rest[_pos]) && !(stopOnSpace && IsSpace(_rest[_pos]))) {
      ++_pos;
    }
    if (_pos == start) {
      return std::nullopt;
    }
    return _rest.substr(start, _pos - start);
  }

  // Quoted string including its quotes, backslash escapes honored.
  std::optional<std::string_view> quoted() noexcept {
    const std::size_t start = _pos;
    for (std::size_t pos = _pos + 1; pos < _rest.size(); ++pos) {
      if (_rest[pos] == '\\') {
        ++pos;
      } else if (_rest[pos] == '"') {
        _pos = pos + 1;
        return _rest.substr(start, _pos - start);
      }
    }
    return std::nullopt;
  }

  // Optional "charset'language'" prefix of an extended value.
  void extendedPrefix(Fragment& fragment) noexcept {
    const std::size_t firstTick = _rest.find('\'', _pos);
    if (firstTick == std::string_view::npos || firstTick == _pos) {
      return;
    }
    const std::size_t secondTick = _rest.find('\'', firstTick + 1);
    if (secondTick == std::string_view::npos) {
      return;
    }
    const auto hasSpace = [this](std::size_t from, std::size_t to) {
      return std::any_of(_rest.begin() + static_cast<std::ptrdiff_t>(from),
                         _rest.begin() + static_cast<std::ptrdiff_t>(to), IsSpace);
    };
    if (hasSpace(_pos, secondTick)) {
      return;
    }
    fragment.encoding = _rest.substr(_pos, firstTick - _pos);
    _pos = secondTick + 1;
  }

  std::string_view _rest;
  std::size_t _pos{0};
};

std::string CleanValue(std::string_view raw) {
  const std::string_view stripped = TrimChars(raw, "\" ");
  std::string ret;
  ret.reserve(stripped.size());
  for (std::size_t pos = 0; pos < stripped.size(); ++pos) {
    if (stripped[pos] == '\\' && pos + 1 < stripped.size() && (stripped[pos + 1] == '\\' || stripped[pos + 1] == '"')) {
      ++pos;
    }
    ret.push_back(stripped[pos]);
  }
  return ret;
}

// Extended values which cannot be decoded with their declared charset are kept percent-decoded as is.
std::string DecodeExtended(std::string_view raw, std::string_view encoding) {
  std::string bytes = url::Decode(raw, '+', false).value_or(std::string(raw));
  const auto charset = charset::FromName(encoding);
  if (!charset) {
    return bytes;
  }
  return charset::Decode(bytes, *charset, charset::ErrorMode::Replace);
}

struct Continuation {
  std::size_t index;
  std::string value;
};

void SetOption(vector<HeaderOption>& options, std::string_view name, std::string value) {
  const auto it = std::ranges::find_if(
      options, [name](const HeaderOption& option) { return CaseInsensitiveEqual(option.name, name); });
  if (it != options.end()) {
    it->value = std::move(value);
  } else {
    options.emplace_back(std::string(name), std::move(value));
  }
}

}  // namespace

std::optional<std::string_view> OptionsHeader::option(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(
      options, [name](const HeaderOption& option) { return CaseInsensitiveEqual(option.name, name); });
  if (it == options.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

OptionsHeader ParseOptionsHeader(std::string_view headerValue) {
  OptionsHeader ret;

  const auto semicolon = headerValue.find(';');
  ret.value.assign(TrimOws(headerValue.substr(0, semicolon)));
  if (semicolon == std::string_view::npos) {
    return ret;
  }

  struct PendingContinuations {
    std::string name;
    vector<Continuation> fragments;
  };
  vector<PendingContinuations> pending;

  OptionsScanner scanner(headerValue.substr(semicolon + 1));
  while (!scanner.atEnd()) {
    auto fragment = scanner.next();
    if (!fragment) {
      break;
    }

    std::string value;
    if (fragment->value) {
      value = fragment->encoding ? DecodeExtended(*fragment->value, *fragment->encoding)
                                 : std::string(*fragment->value);
    }
    value = CleanValue(value);

    if (fragment->count) {
      const auto it = std::ranges::find_if(pending, [&fragment](const PendingContinuations& entry) {
        return CaseInsensitiveEqual(entry.name, fragment->key);
      });
      auto& entry = it == pending.end() ? pending.emplace_back(std::string(fragment->key)) : *it;
      entry.fragments.emplace_back(*fragment->count, std::move(value));
    } else {
      SetOption(ret.options, fragment->key, std::move(value));
    }
  }

  for (auto& entry : pending) {
    std::ranges::stable_sort(entry.fragments, {}, &Continuation::index);
    std::string joined;
    for (const auto& continuation : entry.fragments) {
      joined.append(continuation.value);
    }
    SetOption(ret.options, entry.name, std::move(joined));
  }

  return ret;
}

}  // namespace conduit

#include "conduit/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "conduit/char-hexadecimal-converter.hpp"

namespace conduit::url {

char* DecodeInPlace(char* first, char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (last - first < 3) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          break;
        }
        const char c1 = first[1];
        const char c2 = first[2];
        const int v1 = from_hex_digit(c1);
        const int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          // keep the '%' literal, following chars are processed normally
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::optional<std::string> Decode(std::string_view encoded, char plusAs, bool strictInvalid) {
  std::string ret(encoded);
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), plusAs, strictInvalid);
  if (newEnd == nullptr) {
    return std::nullopt;
  }
  ret.resize(static_cast<std::string::size_type>(newEnd - ret.data()));
  return ret;
}

}  // namespace conduit::url

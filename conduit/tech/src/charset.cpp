#include "conduit/charset.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/string-trim.hpp"

namespace conduit::charset {
namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

struct CharsetAlias {
  std::string_view name;
  Charset charset;
};

constexpr std::array kAliases{
    CharsetAlias{"utf-8", Charset::Utf8},          CharsetAlias{"utf8", Charset::Utf8},
    CharsetAlias{"ascii", Charset::Ascii},         CharsetAlias{"us-ascii", Charset::Ascii},
    CharsetAlias{"latin-1", Charset::Latin1},      CharsetAlias{"latin1", Charset::Latin1},
    CharsetAlias{"iso-8859-1", Charset::Latin1},   CharsetAlias{"iso8859-1", Charset::Latin1},
    CharsetAlias{"l1", Charset::Latin1},           CharsetAlias{"windows-1252", Charset::Windows1252},
    CharsetAlias{"cp1252", Charset::Windows1252},
};

// 0x80 - 0x9F range of windows-1252, 0 for undefined positions.
constexpr std::array<char16_t, 32> kWindows1252High{
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, 0x02C6, 0x2030, 0x0160,
    0x2039, 0x0152, 0,      0x017D, 0,      0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022,
    0x2013, 0x2014, 0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

[[noreturn]] void ThrowInvalidByte(Charset charset, std::size_t pos) {
  throw std::invalid_argument(std::string("Invalid ") + std::string(CharsetToStr(charset)) + " byte sequence at offset " +
                              std::to_string(pos));
}

// Returns the length of the valid UTF-8 sequence starting at 'pos', or 0 if invalid.
std::size_t Utf8SequenceLength(std::string_view bytes, std::size_t pos) noexcept {
  const auto byteAt = [bytes](std::size_t idx) { return static_cast<unsigned char>(bytes[idx]); };
  const unsigned char lead = byteAt(pos);
  if (lead < 0x80) {
    return 1;
  }
  std::size_t len;
  unsigned char minSecond = 0x80;
  unsigned char maxSecond = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0) {
      minSecond = 0xA0;  // overlong
    } else if (lead == 0xED) {
      maxSecond = 0x9F;  // surrogates
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0) {
      minSecond = 0x90;
    } else if (lead == 0xF4) {
      maxSecond = 0x8F;  // > U+10FFFF
    }
  } else {
    return 0;
  }
  if (pos + len > bytes.size()) {
    return 0;
  }
  const unsigned char second = byteAt(pos + 1);
  if (second < minSecond || second > maxSecond) {
    return 0;
  }
  for (std::size_t idx = 2; idx < len; ++idx) {
    const unsigned char cont = byteAt(pos + idx);
    if (cont < 0x80 || cont > 0xBF) {
      return 0;
    }
  }
  return len;
}

std::string DecodeUtf8(std::string_view bytes, ErrorMode mode) {
  std::string out;
  out.reserve(bytes.size());
  for (std::size_t pos = 0; pos < bytes.size();) {
    const std::size_t len = Utf8SequenceLength(bytes, pos);
    if (len == 0) {
      if (mode == ErrorMode::Strict) {
        ThrowInvalidByte(Charset::Utf8, pos);
      }
      AppendUtf8(kReplacementChar, out);
      ++pos;
      continue;
    }
    out.append(bytes.substr(pos, len));
    pos += len;
  }
  return out;
}

std::string DecodeSingleByte(std::string_view bytes, Charset charset, ErrorMode mode) {
  std::string out;
  out.reserve(bytes.size());
  for (std::size_t pos = 0; pos < bytes.size(); ++pos) {
    const auto byte = static_cast<unsigned char>(bytes[pos]);
    char32_t codePoint = byte;
    if (byte >= 0x80) {
      if (charset == Charset::Ascii) {
        codePoint = 0;
      } else if (charset == Charset::Windows1252 && byte <= 0x9F) {
        codePoint = kWindows1252High[byte - 0x80U];
      }
      if (codePoint == 0) {
        if (mode == ErrorMode::Strict) {
          ThrowInvalidByte(charset, pos);
        }
        codePoint = kReplacementChar;
      }
    }
    AppendUtf8(codePoint, out);
  }
  return out;
}

}  // namespace

std::optional<Charset> FromName(std::string_view name) noexcept {
  name = TrimOws(name);
  for (const auto& alias : kAliases) {
    if (CaseInsensitiveEqual(alias.name, name)) {
      return alias.charset;
    }
  }
  return std::nullopt;
}

std::string_view CharsetToStr(Charset charset) noexcept {
  switch (charset) {
    case Charset::Utf8:
      return "utf-8";
    case Charset::Ascii:
      return "us-ascii";
    case Charset::Latin1:
      return "iso-8859-1";
    case Charset::Windows1252:
      return "windows-1252";
  }
  return "unknown";
}

bool IsValidUtf8(std::string_view bytes) noexcept {
  for (std::size_t pos = 0; pos < bytes.size();) {
    const std::size_t len = Utf8SequenceLength(bytes, pos);
    if (len == 0) {
      return false;
    }
    pos += len;
  }
  return true;
}

void AppendUtf8(char32_t codePoint, std::string& out) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

std::string Decode(std::string_view bytes, Charset charset, ErrorMode mode) {
  if (charset == Charset::Utf8) {
    return DecodeUtf8(bytes, mode);
  }
  return DecodeSingleByte(bytes, charset, mode);
}

std::string Decode(std::string_view bytes, std::string_view charsetName, ErrorMode mode) {
  const auto charset = FromName(charsetName);
  if (!charset) {
    throw std::invalid_argument(std::string("Unknown charset '") + std::string(charsetName) + "'");
  }
  return Decode(bytes, *charset, mode);
}

}  // namespace conduit::charset

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::charset {

enum class Charset : std::uint8_t { Utf8, Ascii, Latin1, Windows1252 };

// Behavior on bytes that are not valid in the source charset.
//   Strict : throw std::invalid_argument
//   Replace: emit U+FFFD for each offending byte
enum class ErrorMode : std::uint8_t { Strict, Replace };

inline constexpr std::string_view kDefaultCharset = "utf-8";

// Resolve a charset label (case-insensitive, with the usual aliases such as "latin-1" or "us-ascii").
[[nodiscard]] std::optional<Charset> FromName(std::string_view name) noexcept;

[[nodiscard]] std::string_view CharsetToStr(Charset charset) noexcept;

[[nodiscard]] bool IsValidUtf8(std::string_view bytes) noexcept;

// Decode 'bytes' encoded in 'charset' into UTF-8.
std::string Decode(std::string_view bytes, Charset charset, ErrorMode mode = ErrorMode::Strict);

// Same as above with a charset label. Throws std::invalid_argument for unknown labels.
std::string Decode(std::string_view bytes, std::string_view charsetName, ErrorMode mode = ErrorMode::Strict);

// Encode a code point into UTF-8, appending to 'out'.
void AppendUtf8(char32_t codePoint, std::string& out);

}  // namespace conduit::charset

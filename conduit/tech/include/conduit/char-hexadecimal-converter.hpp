#pragma once

namespace conduit {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Decode a single octal digit. Returns -1 if invalid.
constexpr int from_oct_digit(char ch) {
  if (ch >= '0' && ch <= '7') {
    return ch - '0';
  }
  return -1;
}

}  // namespace conduit

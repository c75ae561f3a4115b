#pragma once

#include <string>

namespace conduit {

// A header as delivered by the transport: byte strings, original case, duplicates allowed.
struct RawHeader {
  std::string name;
  std::string value;

  bool operator==(const RawHeader&) const noexcept = default;
};

}  // namespace conduit

#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <string>

namespace conduit {

// Generic JSON document (object, array, string, number, boolean or null).
using JsonValue = glz::json_t;

/// Serialize a C++ object to a JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

}  // namespace conduit

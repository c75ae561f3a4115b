#pragma once

#include <cstdint>

namespace conduit {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize };

  // Behavior for resolving paths that differ only by a trailing slash.
  //   Strict   : exact-only matching, '/p' and '/p/' are distinct routes.
  //   Normalize: one trailing slash is ignored both at registration and at lookup, so '/p' and '/p/' are
  //              the same route.
  // Root path "/" is never normalized.
  // Default: Strict
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Strict};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy);

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;
};

}  // namespace conduit

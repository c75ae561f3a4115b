#include "conduit/router-config.hpp"

#include <stdexcept>

namespace conduit {

RouterConfig& RouterConfig::withTrailingSlashPolicy(TrailingSlashPolicy policy) {
  trailingSlashPolicy = policy;
  return *this;
}

void RouterConfig::validate() const {
  if (trailingSlashPolicy != TrailingSlashPolicy::Strict && trailingSlashPolicy != TrailingSlashPolicy::Normalize) {
    throw std::invalid_argument("Invalid trailing slash policy");
  }
}

}  // namespace conduit

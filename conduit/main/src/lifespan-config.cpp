#include "conduit/lifespan-config.hpp"

#include <algorithm>
#include <functional>
#include <utility>

#include "conduit/errors.hpp"
#include "conduit/task.hpp"

namespace conduit {

namespace internal {

Task<void> RunSynchronousCallback(std::function<void()> fn) {
  fn();
  co_return;
}

}  // namespace internal

void LifespanConfig::validate() const {
  const auto isEmpty = [](const LifespanCallback& callback) { return !callback; };
  if (std::ranges::any_of(startupCallbacks, isEmpty)) {
    throw ConfigurationError("Cannot register empty startup callback");
  }
  if (std::ranges::any_of(shutdownCallbacks, isEmpty)) {
    throw ConfigurationError("Cannot register empty shutdown callback");
  }
}

}  // namespace conduit

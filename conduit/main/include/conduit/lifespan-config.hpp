#pragma once

#include <functional>
#include <type_traits>
#include <utility>

#include "conduit/task.hpp"
#include "conduit/vector.hpp"

namespace conduit {

// Zero-argument asynchronous lifecycle callback.
using LifespanCallback = std::function<Task<void>()>;

namespace internal {

Task<void> RunSynchronousCallback(std::function<void()> fn);

}  // namespace internal

// Turns 'fn' into a LifespanCallback. Coroutine callables returning Task<void> are kept as is, plain synchronous
// callables returning void are wrapped into a coroutine.
template <class F>
[[nodiscard]] LifespanCallback MakeLifespanCallback(F&& fn) {
  using R = std::invoke_result_t<std::decay_t<F>&>;
  if constexpr (std::is_same_v<R, Task<void>>) {
    return LifespanCallback(std::forward<F>(fn));
  } else if constexpr (std::is_void_v<R>) {
    std::function<void()> syncFn(std::forward<F>(fn));
    if (!syncFn) {
      return {};
    }
    return [syncFn = std::move(syncFn)]() { return internal::RunSynchronousCallback(syncFn); };
  } else {
    static_assert(false, "Lifespan callbacks must return void or Task<void>");
  }
}

struct LifespanConfig {
  // Appends a callback run on 'lifespan.startup', after the previously registered ones.
  template <class F>
  LifespanConfig& withStartupCallback(F&& fn) {
    startupCallbacks.push_back(MakeLifespanCallback(std::forward<F>(fn)));
    return *this;
  }

  // Appends a callback run on 'lifespan.shutdown', after the previously registered ones.
  template <class F>
  LifespanConfig& withShutdownCallback(F&& fn) {
    shutdownCallbacks.push_back(MakeLifespanCallback(std::forward<F>(fn)));
    return *this;
  }

  // Throws ConfigurationError if a callback is empty.
  void validate() const;

  vector<LifespanCallback> startupCallbacks;
  vector<LifespanCallback> shutdownCallbacks;
};

}  // namespace conduit

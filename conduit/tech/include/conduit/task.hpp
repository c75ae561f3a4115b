#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace conduit {

namespace internal {

template <class T>
struct TaskStorage {
  void set(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value.emplace(std::move(value)); }
  T take() { return std::move(*_value); }

  std::optional<T> _value;
};

template <class T>
struct TaskStorage<T&> {
  void set(T& value) noexcept { _ptr = &value; }
  T& take() noexcept { return *_ptr; }

  T* _ptr{nullptr};
};

template <class Promise>
struct TaskFinalAwaiter {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
    if (auto continuation = handle.promise()._continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

}  // namespace internal

// Lazily started coroutine, resumed either by co_await from another Task (symmetric transfer back to the awaiter
// on completion) or by runSynchronously() at the top of the chain.
template <class T>
class Task {
 public:
  struct promise_type {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    std::suspend_always initial_suspend() noexcept { return {}; }
    internal::TaskFinalAwaiter<promise_type> final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T> || std::is_reference_v<T>) {
      _storage.set(std::forward<T>(value));
    }

    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    T consume_result() {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
      return _storage.take();
    }

    std::coroutine_handle<> _continuation;
    std::exception_ptr _exception;
    internal::TaskStorage<T> _storage;
  };

  struct Awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return !_coro || _coro.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
      _coro.promise()._continuation = awaiting;
      return _coro;
    }

    T await_resume() { return _coro.promise().consume_result(); }

    std::coroutine_handle<promise_type> _coro;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  Awaiter operator co_await() const noexcept { return Awaiter{_coro}; }

  // Drives the coroutine chain to completion from a non-coroutine context.
  // Throws std::logic_error if the chain suspends on something other than another Task.
  T runSynchronously() {
    if (!_coro) {
      throw std::logic_error("Cannot run an empty Task");
    }
    if (!_coro.done()) {
      _coro.resume();
    }
    if (!_coro.done()) {
      throw std::logic_error("Task suspended on an external event while run synchronously");
    }
    return _coro.promise().consume_result();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class Task<void> {
 public:
  struct promise_type {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    std::suspend_always initial_suspend() noexcept { return {}; }
    internal::TaskFinalAwaiter<promise_type> final_suspend() noexcept { return {}; }

    void return_void() const noexcept {}
    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    void rethrow_if_needed() const {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
    }

    std::coroutine_handle<> _continuation;
    std::exception_ptr _exception;
  };

  struct Awaiter {
    [[nodiscard]] bool await_ready() const noexcept { return !_coro || _coro.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
      _coro.promise()._continuation = awaiting;
      return _coro;
    }

    void await_resume() const {
      if (_coro) {
        _coro.promise().rethrow_if_needed();
      }
    }

    std::coroutine_handle<promise_type> _coro;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  Awaiter operator co_await() const noexcept { return Awaiter{_coro}; }

  void runSynchronously() {
    if (!_coro) {
      throw std::logic_error("Cannot run an empty Task");
    }
    if (!_coro.done()) {
      _coro.resume();
    }
    if (!_coro.done()) {
      throw std::logic_error("Task suspended on an external event while run synchronously");
    }
    _coro.promise().rethrow_if_needed();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace conduit

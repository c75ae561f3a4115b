#pragma once

#include <cstdint>
#include <string_view>

namespace conduit::internal {

struct LifespanState {
  enum class State : uint8_t { Idle, Started, Stopped };

  void enterStarted() noexcept { state = State::Started; }

  void enterStopped() noexcept { state = State::Stopped; }

  [[nodiscard]] bool isIdle() const noexcept { return state == State::Idle; }
  [[nodiscard]] bool isStarted() const noexcept { return state == State::Started; }
  [[nodiscard]] bool isStopped() const noexcept { return state == State::Stopped; }

  State state{State::Idle};
};

constexpr std::string_view LifespanStateToStr(LifespanState::State state) noexcept {
  switch (state) {
    case LifespanState::State::Idle:
      return "idle";
    case LifespanState::State::Started:
      return "started";
    case LifespanState::State::Stopped:
      return "stopped";
  }
  return "unknown";
}

}  // namespace conduit::internal

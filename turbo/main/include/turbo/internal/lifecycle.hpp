#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

#include "turbo/event-fd.hpp"
#include "turbo/timedef.hpp"

namespace turbo::internal {

// Run state of one reactor: Idle -> Running -> (Draining) -> Stopping -> Idle.
// requestStop() and wakeup() may be called from any thread, the other transitions happen on the reactor thread.
class Lifecycle {
 public:
  enum class State : uint8_t { Idle, Running, Draining, Stopping };

  void enterRunning() noexcept {
    _drainDeadline.reset();
    _state.store(State::Running, std::memory_order_relaxed);
  }

  void reset() noexcept {
    _drainDeadline.reset();
    _state.store(State::Idle, std::memory_order_relaxed);
  }

  // Moves Running to Draining, or tightens the deadline of the ongoing drain. An empty deadline means no limit.
  // Returns true if the drain starts with this call.
  bool requestDrain(std::optional<SteadyTimePoint> deadline) noexcept {
    State expected = State::Running;
    if (_state.compare_exchange_strong(expected, State::Draining, std::memory_order_relaxed)) {
      _drainDeadline = deadline;
      return true;
    }
    if (expected == State::Draining && deadline && (!_drainDeadline || *deadline < *_drainDeadline)) {
      _drainDeadline = deadline;
    }
    return false;
  }

  // Moves Running or Draining to Stopping and wakes the reactor up. Returns the previous state.
  State requestStop() noexcept {
    State expected = _state.load(std::memory_order_relaxed);
    while ((expected == State::Running || expected == State::Draining) &&
           !_state.compare_exchange_weak(expected, State::Stopping, std::memory_order_relaxed)) {
    }
    _wakeupFd.send();
    return expected;
  }

  [[nodiscard]] bool drainExpired(SteadyTimePoint now) const noexcept {
    return _drainDeadline && now >= *_drainDeadline;
  }

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_relaxed); }

  [[nodiscard]] bool isRunning() const noexcept { return state() == State::Running; }
  [[nodiscard]] bool isDraining() const noexcept { return state() == State::Draining; }
  [[nodiscard]] bool isStopping() const noexcept { return state() == State::Stopping; }
  [[nodiscard]] bool isActive() const noexcept { return state() != State::Idle; }

  // Interrupts epoll_wait of the reactor from another thread.
  void wakeup() const noexcept { _wakeupFd.send(); }

  void consumeWakeups() const noexcept { _wakeupFd.read(); }

  [[nodiscard]] int wakeupFd() const noexcept { return _wakeupFd.fd(); }

 private:
  std::optional<SteadyTimePoint> _drainDeadline;
  EventFd _wakeupFd;
  std::atomic<State> _state{State::Idle};
};

}  // namespace turbo::internal

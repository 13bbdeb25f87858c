#pragma once

#include <signal.h>

#include <chrono>

namespace turbo {

// Routes SIGINT and SIGTERM to a process wide stop request for its lifetime, restoring the previous dispositions
// on destruction. Event loops poll IsStopRequested() and drain within MaxDrainPeriod() once it is set.
class SignalHandler {
 public:
  // Clears any previous stop request. 'maxDrainPeriod' of 0 means no limit.
  explicit SignalHandler(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{5000});

  SignalHandler(const SignalHandler&) = delete;
  SignalHandler(SignalHandler&&) = delete;
  SignalHandler& operator=(const SignalHandler&) = delete;
  SignalHandler& operator=(SignalHandler&&) = delete;

  ~SignalHandler();

  static bool IsStopRequested() noexcept;

  // Number of the last stop signal received, 0 if none.
  static int StopSignal() noexcept;

  static std::chrono::milliseconds MaxDrainPeriod() noexcept;

 private:
  struct sigaction _previousInt{};
  struct sigaction _previousTerm{};
};

}  // namespace turbo

#pragma once

#include <cstdint>

#include "turbo/base-fd.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

// Periodic CLOCK_MONOTONIC timerfd (non-blocking, close-on-exec), armed at construction.
// Its fd becomes readable once per elapsed period, which lets an epoll loop run its maintenance even when
// epoll_wait never times out under load.
class TimerFd {
 public:
  // Throws std::invalid_argument if 'period' is not positive, std::system_error if the timer cannot be created.
  explicit TimerFd(SysDuration period);

  // Number of periods elapsed since the previous call (0 if none), accumulated by the kernel.
  [[nodiscard]] uint64_t consumeTicks() const noexcept;

  [[nodiscard]] SysDuration period() const noexcept { return _period; }

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
  SysDuration _period;
};

}  // namespace turbo

#include "turbo/timer-fd.hpp"

#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <utility>

#include "turbo/errno-throw.hpp"
#include "turbo/log.hpp"

namespace turbo {

TimerFd::TimerFd(SysDuration period)
    : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)), _period(period) {
  if (!_baseFd) {
    throw_errno("Unable to create a new TimerFd");
  }
  if (period <= SysDuration::zero()) {
    throw std::invalid_argument("TimerFd period should be positive");
  }
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(period);
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(period - secs);
  const timespec ts{static_cast<time_t>(secs.count()), static_cast<long>(nanos.count())};
  const itimerspec spec{ts, ts};
  if (::timerfd_settime(_baseFd.fd(), 0, &spec, nullptr) != 0) {
    throw_errno("timerfd_settime failed (fd # {})", _baseFd.fd());
  }
  log::debug("TimerFd fd # {} armed every {} us", _baseFd.fd(),
             std::chrono::duration_cast<std::chrono::microseconds>(period).count());
}

uint64_t TimerFd::consumeTicks() const noexcept {
  uint64_t ticks = 0;
  const auto ret = ::read(_baseFd.fd(), &ticks, sizeof(ticks));
  if (std::cmp_equal(ret, sizeof(ticks))) {
    return ticks;
  }
  if (ret == -1 && errno != EAGAIN) {
    log::error("TimerFd read failed on fd # {}: {}", _baseFd.fd(), std::strerror(errno));
  }
  return 0;
}

}  // namespace turbo

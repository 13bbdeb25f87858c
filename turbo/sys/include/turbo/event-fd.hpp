#pragma once

#include "turbo/base-fd.hpp"

namespace turbo {

// RAII wrapper over a non-blocking, close-on-exec Linux eventfd.
// send() may be called from any thread; it is the cross-thread wakeup primitive of the event loops.
class EventFd {
 public:
  // Create the eventfd. Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace turbo

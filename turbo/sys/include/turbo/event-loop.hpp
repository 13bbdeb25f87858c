#pragma once

#include <cstdint>
#include <span>

#include "turbo/base-fd.hpp"
#include "turbo/event.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

// Thin RAII wrapper over a level-triggered epoll instance.
//
// The event buffer starts with kInitialCapacity slots and doubles whenever a poll returns exactly
// capacity() events. It never shrinks: poll cost is independent of capacity.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventFd(int fd, EventBmp eventBmp) : eventBmp(eventBmp), fd(fd) {}

    EventBmp eventBmp;
    int fd;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll cannot be created.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events. Throws std::system_error on error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer:
  //  - a non-empty span of ready events on success,
  //  - an empty span with non-null data() on timeout or EINTR,
  //  - an empty span with nullptr data() on unrecoverable failure (logged).
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  uint32_t _nbAllocatedEvents = 0;
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  void* _pEvents = nullptr;
};

}  // namespace turbo

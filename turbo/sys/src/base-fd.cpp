#include "turbo/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "turbo/log.hpp"

namespace turbo {

BaseFd::BaseFd(BaseFd&& other) noexcept : _fd(std::exchange(other._fd, kClosedFd)) {}

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = std::exchange(other._fd, kClosedFd);
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // Linux frees the descriptor before reporting EINTR, so close is never retried.
  if (::close(_fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
  } else {
    log::trace("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

}  // namespace turbo

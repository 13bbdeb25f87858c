#pragma once

#include <cstdint>
#include <string_view>

#include "turbo/base-fd.hpp"

namespace turbo {

// RAII class wrapping an IPv4 TCP socket.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Try to bind the socket to the given IPv4 address and port.
  // Returns false if bind fails (typically EADDRINUSE).
  // Throws std::invalid_argument for a malformed address and std::system_error on setsockopt failure.
  [[nodiscard]] bool tryBind(std::string_view address, bool reusePort, bool tcpNoDelay, uint16_t port) const;

  // Bind and start listening. If port is 0, an ephemeral port is chosen and written back into 'port'.
  // Throws std::system_error on failure.
  void bindAndListen(std::string_view address, bool reusePort, bool tcpNoDelay, uint16_t& port);

  // Connect (blocking) to the given IPv4 address and port. Throws std::system_error on failure.
  void connect(std::string_view address, uint16_t port) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace turbo

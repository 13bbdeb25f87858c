#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace turbo {

// Thin wrappers centralising socket system calls so that higher-level modules never include
// networking headers directly.

// Set a file descriptor to non-blocking mode. Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket. Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Retrieve the pending socket error (SO_ERROR). 0 means no error.
int GetSocketError(int fd) noexcept;

// Returns the textual IPv4 address of the remote peer of 'fd', or an empty string on failure.
std::string PeerAddress(int fd);

// Accept a pending connection as a non-blocking, close-on-exec socket.
// Returns -1 when no connection is pending or on error (errno is set).
int AcceptNonBlocking(int listenFd, std::string& peerAddress);

// Send data on a connected socket with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// Shutdown the write half of a socket connection. Returns true on success.
bool ShutdownWrite(int fd) noexcept;

}  // namespace turbo

#include "turbo/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbo/errno-throw.hpp"
#include "turbo/log.hpp"
#include "turbo/socket-ops.hpp"

namespace turbo {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

sockaddr_in MakeAddress(std::string_view address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string addressStr(address.empty() ? std::string_view("0.0.0.0") : address);
  if (::inet_pton(AF_INET, addressStr.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 address '" + addressStr + "'");
  }
  return addr;
}

int ToSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

bool Socket::tryBind(std::string_view address, bool reusePort, bool tcpNoDelay, uint16_t port) const {
  static constexpr int kEnable = 1;
  const int sockFd = fd();
  if (::setsockopt(sockFd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed for fd # {}", sockFd);
  }
  if (reusePort && ::setsockopt(sockFd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed for fd # {}", sockFd);
  }
  if (tcpNoDelay && !SetTcpNoDelay(sockFd)) {
    throw_errno("setsockopt(TCP_NODELAY) failed for fd # {}", sockFd);
  }
  const sockaddr_in addr = MakeAddress(address, port);
  return ::bind(sockFd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

void Socket::bindAndListen(std::string_view address, bool reusePort, bool tcpNoDelay, uint16_t& port) {
  const int sockFd = fd();
  if (!tryBind(address, reusePort, tcpNoDelay, port)) {
    throw_errno("bind failed for fd # {} on port {}", sockFd, port);
  }
  if (::listen(sockFd, kListenBacklog) != 0) {
    throw_errno("listen failed for fd # {}", sockFd);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(sockFd, reinterpret_cast<sockaddr*>(&actual), &len) != 0) {
      throw_errno("getsockname failed for fd # {}", sockFd);
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", sockFd, port);
}

void Socket::connect(std::string_view address, uint16_t port) const {
  const sockaddr_in addr = MakeAddress(address, port);
  while (::connect(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    if (errno == EINTR) {
      continue;
    }
    throw_errno("connect to port {} failed", port);
  }
}

}  // namespace turbo

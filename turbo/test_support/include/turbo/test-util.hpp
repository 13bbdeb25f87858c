#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "turbo/http-status-code.hpp"
#include "turbo/socket.hpp"

namespace turbo::test {

using namespace std::chrono_literals;

// Blocking loopback client socket, connected on construction (retrying until 'timeout').
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if the connection cannot be established in time.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 500ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // First value of header 'name', case insensitive.
  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
  std::chrono::milliseconds recvTimeout{2000ms};
};

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until a complete response (head plus Content-Length bytes of body) has been received, the peer closed
// the connection or the timeout elapsed. Returns what was read.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 1000ms);

// Reads until the peer closes the connection (or the receive timeout set on the socket elapses).
std::string recvUntilClosed(int fd);

// Very small HTTP/1.1 response parser, for test consumption only. Parses the first response of 'raw'.
std::optional<ParsedResponse> parseResponse(std::string_view raw);

// Throws std::runtime_error if 'raw' cannot be parsed.
ParsedResponse parseResponseOrThrow(std::string_view raw);

void setRecvTimeout(int fd, std::chrono::milliseconds timeout);

std::string buildRequest(const RequestOptions& opt);

// Sends a request on a new connection and returns the raw bytes received until the server closes it.
std::string request(uint16_t port, const RequestOptions& opt = {});

// Same as request(), parsed. Throws std::runtime_error if the response cannot be parsed.
ParsedResponse requestParsed(uint16_t port, const RequestOptions& opt = {});

ParsedResponse simpleGet(uint16_t port, std::string_view target);

// Number of non overlapping occurrences of 'needle' in 'haystack'.
int countOccurrences(std::string_view haystack, std::string_view needle);

// Returns true if the peer closed 'fd' (end of stream or reset) before 'timeout'.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

}  // namespace turbo::test

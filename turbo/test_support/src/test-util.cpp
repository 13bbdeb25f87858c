#include "turbo/test-util.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "turbo/errno-throw.hpp"
#include "turbo/http-constants.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/log.hpp"
#include "turbo/socket.hpp"
#include "turbo/string-equal-ignore-case.hpp"

namespace turbo::test {

namespace {

constexpr std::size_t kChunkSize = 1 << 13;

Socket ConnectLoop(uint16_t port, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    Socket sock(Socket::Type::Stream);
    try {
      sock.connect("127.0.0.1", port);
      return sock;
    } catch (const std::system_error& ex) {
      if (std::chrono::steady_clock::now() >= deadline) {
        throw;
      }
      log::debug("connect to port {} failed ({}), retrying", port, ex.what());
    }
    std::this_thread::sleep_for(5ms);
  }
}

// Size of the complete first response of 'raw', if it has been fully received.
std::optional<std::size_t> CompleteResponseSize(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  const std::string_view head = raw.substr(0, headerEnd);
  if (head.starts_with("HTTP/1.1 100")) {
    const auto next = CompleteResponseSize(raw.substr(bodyStart));
    if (!next) {
      return std::nullopt;
    }
    return bodyStart + *next;
  }
  std::size_t contentLength = 0;
  std::size_t lineStart = head.find(http::CRLF);
  while (lineStart != std::string_view::npos) {
    lineStart += http::CRLF.size();
    const auto lineEnd = std::min(head.find(http::CRLF, lineStart), head.size());
    const std::string_view line = head.substr(lineStart, lineEnd - lineStart);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colon), http::ContentLength)) {
      std::string_view value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      std::from_chars(value.data(), value.data() + value.size(), contentLength);
    }
    lineStart = lineEnd == head.size() ? std::string_view::npos : lineEnd;
  }
  if (raw.size() < bodyStart + contentLength) {
    return std::nullopt;
  }
  return bodyStart + contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(ConnectLoop(port, timeout)) {}

std::optional<std::string_view> ParsedResponse::header(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(headers, [name](const auto& field) { return CaseInsensitiveEqual(field.first, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const char* cursor = data.data();
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;

  for (std::size_t remaining = data.size(); remaining > 0;) {
    const auto sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (std::chrono::steady_clock::now() >= maxTs) {
        throw_errno("sendAll timed out after {} ms", totalTimeout.count());
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;

  while (std::chrono::steady_clock::now() < maxTs) {
    const std::size_t oldSize = out.size();
    out.resize(oldSize + kChunkSize);
    const auto recvBytes = ::recv(fd, out.data() + oldSize, kChunkSize, MSG_DONTWAIT);
    if (recvBytes == -1) {
      out.resize(oldSize);
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        std::this_thread::sleep_for(1ms);
        continue;
      }
      if (errno == ECONNRESET) {
        break;
      }
      throw_errno("Error from non-blocking recv");
    }
    out.resize(oldSize + static_cast<std::size_t>(recvBytes));
    if (recvBytes == 0 || CompleteResponseSize(out)) {
      break;
    }
  }
  return out;
}

std::string recvUntilClosed(int fd) {
  std::string out;
  while (true) {
    const std::size_t oldSize = out.size();
    out.resize(oldSize + kChunkSize);
    const auto recvBytes = ::recv(fd, out.data() + oldSize, kChunkSize, 0);
    if (recvBytes <= 0) {
      // 0: closed. -1 with EAGAIN: SO_RCVTIMEO elapsed.
      out.resize(oldSize);
      if (recvBytes == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNRESET) {
        throw_errno("Error from recv");
      }
      break;
    }
    out.resize(oldSize + static_cast<std::size_t>(recvBytes));
  }
  return out;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  // skip interim responses
  while (raw.starts_with("HTTP/1.1 100")) {
    const auto end = raw.find(http::DoubleCRLF);
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    raw.remove_prefix(end + http::DoubleCRLF.size());
  }

  ParsedResponse pr;
  const auto pos = raw.find(http::CRLF);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view statusLine = raw.substr(0, pos);
  // Expect: HTTP/1.1 <code> <reason>
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  const auto codeStart = statusLine.data() + firstSpace + 1;
  const auto [ptr, ec] = std::from_chars(codeStart, codeStart + 3, pr.statusCode);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  if (statusLine.size() > firstSpace + 5) {
    pr.reason = statusLine.substr(firstSpace + 5);
  }

  const auto headerEnd = raw.find(http::DoubleCRLF, pos);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  std::size_t cursor = pos + http::CRLF.size();
  while (cursor < headerEnd) {
    auto lineEnd = raw.find(http::CRLF, cursor);
    lineEnd = std::min(lineEnd, headerEnd);
    const std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    pr.headers.emplace_back(line.substr(0, colon), value);
  }

  std::string_view body = raw.substr(headerEnd + http::DoubleCRLF.size());
  if (const auto contentLength = pr.header(http::ContentLength)) {
    std::size_t length = 0;
    std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), length);
    body = body.substr(0, length);
  }
  pr.body = body;
  return pr;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto prOpt = parseResponse(raw);
  if (!prOpt) {
    throw std::runtime_error("parseResponse: failed to parse response");
  }
  return *prOpt;
}

void setRecvTimeout(int fd, std::chrono::milliseconds timeout) {
  const auto timeoutMs = timeout.count();
  struct timeval tv{static_cast<time_t>(timeoutMs / 1000), static_cast<suseconds_t>((timeoutMs % 1000) * 1000)};
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
    throw_errno("Error from setRecvTimeout");
  }
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.reserve(256 + opt.body.size());
  req.append(opt.method).append(" ").append(opt.target).append(" HTTP/1.1\r\n");
  req.append("Host: ").append(opt.host).append(http::CRLF);
  req.append("Connection: ").append(opt.connection).append(http::CRLF);
  bool haveContentLength = false;
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
    haveContentLength = haveContentLength || CaseInsensitiveEqual(name, http::ContentLength);
  }
  if (!opt.body.empty() && !haveContentLength) {
    req.append("Content-Length: ").append(std::to_string(opt.body.size())).append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::string request(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  const int fd = cnx.fd();
  setRecvTimeout(fd, opt.recvTimeout);
  sendAll(fd, buildRequest(opt));
  return recvUntilClosed(fd);
}

ParsedResponse requestParsed(uint16_t port, const RequestOptions& opt) {
  return parseResponseOrThrow(request(port, opt));
}

ParsedResponse simpleGet(uint16_t port, std::string_view target) {
  RequestOptions opt;
  opt.target.assign(target);
  return requestParsed(port, opt);
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[256];
  while (std::chrono::steady_clock::now() < deadline) {
    pollfd pfd{fd, POLLIN, 0};
    const int ret = ::poll(&pfd, 1, 10);
    if (ret <= 0) {
      continue;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
    if (nbRead == 0 || (nbRead == -1 && errno == ECONNRESET)) {
      return true;
    }
  }
  return false;
}

}  // namespace turbo::test

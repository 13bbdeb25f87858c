#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "turbo/http-constants.hpp"
#include "turbo/http-status-code.hpp"

namespace turbo {

// Protocol-ready response: status, content type, extra headers and a fully materialized body.
// Content-Length, Date and Connection are computed at serialization time and must not be set by hand.
class HttpResponse {
 public:
  using Header = std::pair<std::string, std::string>;

  explicit HttpResponse(http::StatusCode status = http::StatusCodeOK) noexcept : _status(status) {}

  HttpResponse(http::StatusCode status, std::string body, std::string_view contentType)
      : _status(status), _contentType(contentType), _body(std::move(body)) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  HttpResponse& status(http::StatusCode status) noexcept {
    _status = status;
    return *this;
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::string_view contentType() const noexcept { return _contentType; }

  HttpResponse& body(std::string body, std::string_view contentType) {
    _body = std::move(body);
    _contentType.assign(contentType);
    return *this;
  }

  // Appends a header. Names are not checked for duplicates.
  HttpResponse& header(std::string_view name, std::string_view value) {
    _headers.emplace_back(name, value);
    return *this;
  }

  [[nodiscard]] std::span<const Header> headers() const noexcept { return _headers; }

  // First value of the header 'name' (case insensitive), Content-Type included.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  bool operator==(const HttpResponse&) const noexcept = default;

 private:
  http::StatusCode _status;
  std::string _contentType;
  std::string _body;
  std::vector<Header> _headers;
};

struct ResponseWireOptions {
  bool keepAlive{true};
  // Body is omitted (but Content-Length kept) in answer to a HEAD request.
  bool headRequest{false};
  bool addDate{true};
  // Headers appended to every response (server wide configuration).
  std::span<const HttpResponse::Header> globalHeaders;
};

// Appends the HTTP/1.1 serialization of 'response' to 'out'.
void AppendResponseWire(std::string& out, const HttpResponse& response, const ResponseWireOptions& options);

}  // namespace turbo

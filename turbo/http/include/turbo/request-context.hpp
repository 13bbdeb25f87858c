#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "turbo/http-method.hpp"

namespace turbo {

// Immutable-after-construction snapshot of one HTTP request, owning all of its strings so that it can
// outlive the connection buffer it was parsed from (async handlers keep it alive across suspension).
class RequestContext {
 public:
  using Field = std::pair<std::string, std::string>;

  RequestContext() noexcept = default;

  RequestContext(http::Method method, std::string_view path) : _method(method), _path(path) {}

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Raw path as received, without query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // HTTP minor version (0 for HTTP/1.0, 1 for HTTP/1.1).
  [[nodiscard]] uint8_t versionMinor() const noexcept { return _versionMinor; }

  // Headers in order of arrival, names as received.
  [[nodiscard]] std::span<const Field> headers() const noexcept { return _headers; }

  // Decoded query parameters in order of arrival. Repeated keys are kept.
  [[nodiscard]] std::span<const Field> queryParams() const noexcept { return _queryParams; }

  // Path parameters captured by the router (raw, not percent-decoded).
  [[nodiscard]] std::span<const Field> pathParams() const noexcept { return _pathParams; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::string_view peerAddress() const noexcept { return _peerAddress; }

  // First value of the header 'name' (case insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // First value of the query parameter 'name' (case sensitive), if any.
  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view name) const noexcept;

  [[nodiscard]] std::optional<std::string_view> pathParamValue(std::string_view name) const noexcept;

  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

  [[nodiscard]] bool isHead() const noexcept { return _method == http::Method::HEAD; }

  void setMethod(http::Method method) noexcept { _method = method; }
  void setPath(std::string_view path) { _path.assign(path); }
  void setVersionMinor(uint8_t versionMinor) noexcept { _versionMinor = versionMinor; }
  void addHeader(std::string_view name, std::string_view value) { _headers.emplace_back(name, value); }
  void addQueryParam(std::string key, std::string value) { _queryParams.emplace_back(std::move(key), std::move(value)); }
  void addPathParam(std::string_view key, std::string_view value) { _pathParams.emplace_back(key, value); }
  void clearPathParams() noexcept { _pathParams.clear(); }
  void setBody(std::string_view body) { _body.assign(body); }
  void setPeerAddress(std::string_view peerAddress) { _peerAddress.assign(peerAddress); }
  void setKeepAlive(bool keepAlive) noexcept { _keepAlive = keepAlive; }

  // Resets the context for reuse, keeping allocated capacity.
  void clear() noexcept;

 private:
  http::Method _method{http::Method::GET};
  uint8_t _versionMinor{1};
  bool _keepAlive{true};
  std::string _path;
  std::vector<Field> _headers;
  std::vector<Field> _queryParams;
  std::vector<Field> _pathParams;
  std::string _body;
  std::string _peerAddress;
};

}  // namespace turbo

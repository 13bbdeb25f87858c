#include "turbo/request-context.hpp"

#include <optional>
#include <string_view>

#include "turbo/string-equal-ignore-case.hpp"

namespace turbo {

std::optional<std::string_view> RequestContext::headerValue(std::string_view name) const noexcept {
  for (const auto& [headerName, headerValue] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return std::string_view(headerValue);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> RequestContext::queryParamValue(std::string_view name) const noexcept {
  for (const auto& [key, value] : _queryParams) {
    if (key == name) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

std::optional<std::string_view> RequestContext::pathParamValue(std::string_view name) const noexcept {
  for (const auto& [key, value] : _pathParams) {
    if (key == name) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

void RequestContext::clear() noexcept {
  _method = http::Method::GET;
  _versionMinor = 1;
  _keepAlive = true;
  _path.clear();
  _headers.clear();
  _queryParams.clear();
  _pathParams.clear();
  _body.clear();
  // peer address is a property of the connection, kept across requests
}

}  // namespace turbo

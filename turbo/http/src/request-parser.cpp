#include "turbo/request-parser.hpp"

#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "turbo/http-method.hpp"
#include "turbo/http-status-code.hpp"
#include "turbo/request-context.hpp"
#include "turbo/string-equal-ignore-case.hpp"
#include "turbo/url-decode.hpp"

namespace turbo::http {

namespace {

constexpr std::string_view kCRLF = "\r\n";
constexpr std::string_view kDoubleCRLF = "\r\n\r\n";

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// RFC 9110 token characters.
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr std::string_view Trim(std::string_view sv) noexcept {
  while (!sv.empty() && IsHeaderWhitespace(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && IsHeaderWhitespace(sv.back())) {
    sv.remove_suffix(1);
  }
  return sv;
}

ParseResult Error(StatusCode status) noexcept {
  ParseResult ret;
  ret.status = ParseResult::Status::Error;
  ret.errorStatus = status;
  return ret;
}

void ParseQueryString(std::string_view query, RequestContext& out) {
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view item = query.substr(0, ampPos);
    if (!item.empty()) {
      const auto eqPos = item.find('=');
      if (eqPos == std::string_view::npos) {
        out.addQueryParam(url::DecodeQueryComponent(item), {});
      } else {
        out.addQueryParam(url::DecodeQueryComponent(item.substr(0, eqPos)),
                          url::DecodeQueryComponent(item.substr(eqPos + 1)));
      }
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
}

// Parses "METHOD SP target SP HTTP/1.x". Returns 0 on success, the error status otherwise.
StatusCode ParseRequestLine(std::string_view line, RequestContext& out) {
  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos || firstSp == 0) {
    return StatusCodeBadRequest;
  }
  const auto secondSp = line.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || secondSp == firstSp + 1) {
    return StatusCodeBadRequest;
  }
  const std::string_view methodStr = line.substr(0, firstSp);
  std::string_view target = line.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view version = line.substr(secondSp + 1);

  for (char ch : methodStr) {
    if (!IsTokenChar(ch)) {
      return StatusCodeBadRequest;
    }
  }

  if (version == "HTTP/1.1") {
    out.setVersionMinor(1);
  } else if (version == "HTTP/1.0") {
    out.setVersionMinor(0);
  } else if (version.starts_with("HTTP/") && version.size() == 8U && version[6] == '.') {
    return StatusCodeHTTPVersionNotSupported;
  } else {
    return StatusCodeBadRequest;
  }

  const auto method = MethodFromStr(methodStr);
  if (!method) {
    return StatusCodeNotImplemented;
  }
  out.setMethod(*method);

  if (target.front() != '/') {
    return StatusCodeBadRequest;
  }
  for (char ch : target) {
    if (static_cast<unsigned char>(ch) <= 0x20U || ch == 0x7F) {
      return StatusCodeBadRequest;
    }
  }

  const auto fragmentPos = target.find('#');
  if (fragmentPos != std::string_view::npos) {
    target = target.substr(0, fragmentPos);
  }
  const auto queryPos = target.find('?');
  out.setPath(target.substr(0, queryPos));
  if (queryPos != std::string_view::npos) {
    ParseQueryString(target.substr(queryPos + 1), out);
  }
  return 0;
}

}  // namespace

ParseResult ParseRequest(std::string_view data, const ParserLimits& limits, RequestContext& out) {
  // Tolerate empty lines preceding the request line (RFC 9112 section 2.2).
  std::size_t leading = 0;
  while (data.substr(leading).starts_with(kCRLF)) {
    leading += kCRLF.size();
  }
  const std::string_view request = data.substr(leading);

  const auto headEndPos = request.find(kDoubleCRLF);
  if (headEndPos == std::string_view::npos) {
    if (request.size() > limits.maxHeaderBytes) {
      return Error(StatusCodeRequestHeaderFieldsTooLarge);
    }
    return {};
  }
  const std::size_t headSize = headEndPos + kDoubleCRLF.size();
  if (headSize > limits.maxHeaderBytes) {
    return Error(StatusCodeRequestHeaderFieldsTooLarge);
  }

  out.clear();

  std::string_view head = request.substr(0, headEndPos + kCRLF.size());
  auto lineEnd = head.find(kCRLF);
  if (const StatusCode status = ParseRequestLine(head.substr(0, lineEnd), out); status != 0) {
    return Error(status);
  }
  head.remove_prefix(lineEnd + kCRLF.size());

  std::optional<std::size_t> contentLength;
  bool expectContinue = false;
  std::string_view connection;
  while (!head.empty()) {
    lineEnd = head.find(kCRLF);
    const std::string_view line = head.substr(0, lineEnd);
    head.remove_prefix(lineEnd + kCRLF.size());

    // obsolete line folding is rejected
    if (line.empty() || IsHeaderWhitespace(line.front())) {
      return Error(StatusCodeBadRequest);
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return Error(StatusCodeBadRequest);
    }
    const std::string_view name = line.substr(0, colonPos);
    for (char ch : name) {
      if (!IsTokenChar(ch)) {
        return Error(StatusCodeBadRequest);
      }
    }
    const std::string_view value = Trim(line.substr(colonPos + 1));
    for (char ch : value) {
      if (ch == '\r' || ch == '\n' || ch == '\0') {
        return Error(StatusCodeBadRequest);
      }
    }

    if (CaseInsensitiveEqual(name, "Content-Length")) {
      std::size_t len{};
      const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), len);
      if (errc != std::errc() || ptr != value.data() + value.size() || value.empty()) {
        return Error(StatusCodeBadRequest);
      }
      if (contentLength && *contentLength != len) {
        return Error(StatusCodeBadRequest);
      }
      contentLength = len;
    } else if (CaseInsensitiveEqual(name, "Transfer-Encoding")) {
      return Error(StatusCodeNotImplemented);
    } else if (CaseInsensitiveEqual(name, "Expect")) {
      if (!CaseInsensitiveEqual(value, "100-continue")) {
        return Error(StatusCodeBadRequest);
      }
      expectContinue = true;
    } else if (CaseInsensitiveEqual(name, "Connection")) {
      connection = value;
    }
    out.addHeader(name, value);
  }

  if (out.versionMinor() == 0) {
    out.setKeepAlive(HeaderListContainsToken(connection, "keep-alive"));
  } else {
    out.setKeepAlive(!HeaderListContainsToken(connection, "close"));
  }

  const std::size_t bodyLen = contentLength.value_or(0);
  if (bodyLen > limits.maxBodyBytes) {
    return Error(StatusCodePayloadTooLarge);
  }

  const std::size_t totalSize = leading + headSize + bodyLen;
  if (data.size() < totalSize) {
    ParseResult ret;
    ret.expectContinue = expectContinue && out.versionMinor() == 1;
    return ret;
  }

  out.setBody(data.substr(leading + headSize, bodyLen));

  ParseResult ret;
  ret.status = ParseResult::Status::Complete;
  ret.consumed = totalSize;
  return ret;
}

}  // namespace turbo::http

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "turbo/http-status-code.hpp"
#include "turbo/request-context.hpp"

namespace turbo::http {

struct ParserLimits {
  // Maximum size of the request line plus headers, including the terminating blank line.
  std::size_t maxHeaderBytes{8UL * 1024UL};
  // Maximum declared Content-Length.
  std::size_t maxBodyBytes{1UL << 20};
};

struct ParseResult {
  enum class Status : uint8_t { NeedMore, Complete, Error };

  Status status{Status::NeedMore};
  // Number of bytes of the input making up the full request (Complete only).
  std::size_t consumed{};
  // Status to answer with before closing the connection (Error only).
  StatusCode errorStatus{};
  // Head is complete, body is missing and the client asked for 'Expect: 100-continue'.
  bool expectContinue{};
};

// Parses one HTTP/1.x request from the beginning of 'data' into 'out'.
// The parser is stateless: callers accumulate bytes and call it again on NeedMore.
// Only fixed length bodies are supported, a request with Transfer-Encoding is rejected with 501.
ParseResult ParseRequest(std::string_view data, const ParserLimits& limits, RequestContext& out);

}  // namespace turbo::http

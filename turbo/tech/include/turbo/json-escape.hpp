#pragma once

#include <string>
#include <string_view>

namespace turbo {

// Appends 'value' to 'out' as a quoted JSON string, escaping quotes, backslashes and control characters.
// Bytes >= 0x80 are copied as-is (input is expected to be UTF-8).
void AppendJsonString(std::string& out, std::string_view value);

[[nodiscard]] inline std::string JsonString(std::string_view value) {
  std::string out;
  AppendJsonString(out, value);
  return out;
}

}  // namespace turbo

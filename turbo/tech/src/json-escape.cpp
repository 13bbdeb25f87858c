#include "turbo/json-escape.hpp"

#include <string>
#include <string_view>

#include "turbo/char-hexadecimal-converter.hpp"

namespace turbo {

void AppendJsonString(std::string& out, std::string_view value) {
  out.reserve(out.size() + value.size() + 2U);
  out.push_back('"');
  for (char ch : value) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20U) {
          char hex[2];
          to_lower_hex(static_cast<unsigned char>(ch), hex);
          out.append("\\u00");
          out.append(hex, sizeof(hex));
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
}

}  // namespace turbo

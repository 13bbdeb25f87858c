#include "turbo/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "turbo/char-hexadecimal-converter.hpp"

namespace turbo::url {

char* DecodeInPlace(char* first, char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    const char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (last - first < 3) {
          if (strictInvalid) {
            return nullptr;
          }
          // keep the truncated sequence verbatim
          while (first < last) {
            *out++ = *first++;
          }
          return out;
        }
        const char c1 = first[1];
        const char c2 = first[2];
        const int v1 = from_hex_digit(c1);
        const int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string DecodeQueryComponent(std::string_view encoded) {
  std::string decoded(encoded);
  char* end = DecodeInPlace(decoded.data(), decoded.data() + decoded.size(), ' ', false);
  decoded.resize(static_cast<std::size_t>(end - decoded.data()));
  return decoded;
}

bool DecodePathSegment(std::string_view encoded, std::string& out) {
  out.assign(encoded);
  char* end = DecodeInPlace(out.data(), out.data() + out.size(), '+', true);
  if (end == nullptr) {
    return false;
  }
  out.resize(static_cast<std::size_t>(end - out.data()));
  return true;
}

}  // namespace turbo::url

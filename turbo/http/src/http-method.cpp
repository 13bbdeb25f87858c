#include "turbo/http-method.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "turbo/string-equal-ignore-case.hpp"

namespace turbo::http {

std::optional<Method> MethodFromStrIgnoreCase(std::string_view str) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(kMethodStrings[methodIdx], str)) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

std::string MethodBmpToAllowValue(MethodBmp methods) {
  std::string allow;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodSet(methods, MethodFromIdx(methodIdx))) {
      if (!allow.empty()) {
        allow.append(", ");
      }
      allow.append(kMethodStrings[methodIdx]);
    }
  }
  return allow;
}

}  // namespace turbo::http

#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace turbo::http {

enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

using MethodIdx = uint8_t;
inline constexpr MethodIdx kNbMethods = 9;

using MethodBmp = uint16_t;

static_assert(kNbMethods <= sizeof(MethodBmp) * 8, "MethodBmp type too small to hold all methods");

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(static_cast<T>(lhs) | static_cast<T>(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  using T = std::underlying_type_t<Method>;
  return static_cast<MethodBmp>(lhs | static_cast<T>(rhs));
}

constexpr bool IsMethodSet(MethodBmp mask, Method method) noexcept {
  return (mask & static_cast<MethodBmp>(method)) != 0U;
}

constexpr MethodIdx MethodToIdx(Method method) noexcept {
  return static_cast<MethodIdx>(std::countr_zero(static_cast<std::underlying_type_t<Method>>(method)));
}

constexpr Method MethodFromIdx(MethodIdx methodIdx) noexcept { return static_cast<Method>(1U << methodIdx); }

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodStrings[MethodToIdx(method)]; }

// Exact (case-sensitive) match as required for the HTTP request line.
constexpr std::optional<Method> MethodFromStr(std::string_view str) noexcept {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

// Case-insensitive variant used for route registration ("get", "Post", ...).
std::optional<Method> MethodFromStrIgnoreCase(std::string_view str) noexcept;

// Comma separated list of the methods of 'methods' suitable for an Allow header.
std::string MethodBmpToAllowValue(MethodBmp methods);

}  // namespace turbo::http

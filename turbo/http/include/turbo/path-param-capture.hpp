#pragma once

#include <string_view>

namespace turbo {

struct PathParamCapture {
  std::string_view key;
  std::string_view value;
};

}  // namespace turbo

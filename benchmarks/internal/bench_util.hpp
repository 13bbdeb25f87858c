// Benchmark utilities bridging a subset of the test utilities without
// forcing benchmarks to include the entire test header set.
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "turbo/test-util.hpp"

namespace bench_util {
using ClientConnection = ::turbo::test::ClientConnection;  // re-export
using namespace std::chrono_literals;

inline void sendAll(int fd, std::string_view data) { ::turbo::test::sendAll(fd, data); }
inline std::string recvWithTimeout(int fd, std::chrono::milliseconds total = 2000ms) {
  return ::turbo::test::recvWithTimeout(fd, total);
}
}  // namespace bench_util

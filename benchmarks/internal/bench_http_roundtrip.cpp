// Loopback round trip benchmarks through the embedded interpreter:
//  - sync and async handlers on a keep-alive connection
//  - sync handlers while N async executions are suspended on the scheduler (range(0)),
//    to check that sync latency does not depend on async load

#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "bench_util.hpp"
#include "turbo/http-constants.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/python-runtime.hpp"
#include "turbo/test-server.hpp"

namespace {

constexpr std::string_view kApp = R"py(
import asyncio
import turbo

@turbo.get("/sync")
def sync_route():
    return {"kind": "sync"}

@turbo.get("/async")
async def async_route():
    await asyncio.sleep(0)
    return {"kind": "async"}

@turbo.get("/park")
async def park():
    await asyncio.sleep(3600)
)py";

constexpr std::string_view kSyncReq = "GET /sync HTTP/1.1\r\nHost: localhost\r\n\r\n";
constexpr std::string_view kAsyncReq = "GET /async HTTP/1.1\r\nHost: localhost\r\n\r\n";
constexpr std::string_view kParkReq = "GET /park HTTP/1.1\r\nHost: localhost\r\n\r\n";

class RoundTripFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& state) override {
    server = std::make_unique<turbo::test::TestServer>(
        turbo::HttpServerConfig{}.withHandlerTimeout(std::chrono::hours{1}).withMaxConnections(4096));
    client = std::make_unique<bench_util::ClientConnection>(server->port());
    const auto nbParked = state.range(0);
    for (int64_t parkedPos = 0; parkedPos < nbParked; ++parkedPos) {
      bench_util::sendAll(parked.emplace_back(server->port()).fd(), kParkReq);
    }
  }

  void TearDown(const benchmark::State& /* state */) override {
    parked.clear();
    client.reset();
    server.reset();
  }

  bool roundTrip(std::string_view req) {
    bench_util::sendAll(client->fd(), req);
    const auto raw = bench_util::recvWithTimeout(client->fd());
    return raw.starts_with("HTTP/1.1 200");
  }

  void run(benchmark::State& state, std::string_view req) {
    for ([[maybe_unused]] auto iter : state) {
      if (!roundTrip(req)) {
        state.SkipWithError("roundtrip failed");
        break;
      }
    }
    state.counters["parked"] = static_cast<double>(state.range(0));
  }

  std::unique_ptr<turbo::test::TestServer> server;
  std::unique_ptr<bench_util::ClientConnection> client;
  std::vector<bench_util::ClientConnection> parked;
};

BENCHMARK_DEFINE_F(RoundTripFixture, SyncHandler)(benchmark::State& state) { run(state, kSyncReq); }

BENCHMARK_DEFINE_F(RoundTripFixture, AsyncHandler)(benchmark::State& state) { run(state, kAsyncReq); }

BENCHMARK_REGISTER_F(RoundTripFixture, SyncHandler)->Arg(0)->Arg(16)->Arg(256);
BENCHMARK_REGISTER_F(RoundTripFixture, AsyncHandler)->Arg(0)->Arg(256);

}  // namespace

int main(int argc, char** argv) {
  turbo::PythonRuntime runtime;
  runtime.runString(kApp, "<bench>");

  benchmark::Initialize(&argc, argv);
  if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  benchmark::RunSpecifiedBenchmarks();
  benchmark::Shutdown();
  return 0;
}

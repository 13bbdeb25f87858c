#include "turbo/multi-http-server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "turbo/execution-lock.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-test-env.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/test-util.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo {

namespace {

using namespace std::chrono_literals;

const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);

constexpr const char* kApp = R"py(
import asyncio
import turbo

@turbo.get("/")
def root():
    return "root"

@turbo.get("/info")
def info():
    return turbo.info()

@turbo.get("/async")
async def later():
    await asyncio.sleep(0.01)
    return "later"
)py";

HttpServerConfig LoopbackConfig(uint32_t nbThreads) {
  return HttpServerConfig{}
      .withBindAddress("127.0.0.1")
      .withNbThreads(nbThreads)
      .withPollInterval(std::chrono::milliseconds{10});
}

class MultiHttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test::ResetTurboModule();
    test::RunPython(kApp);
  }

  void TearDown() override { test::ResetTurboModule(); }
};

}  // namespace

TEST_F(MultiHttpServerTest, ServesFromAllReactors) {
  MultiHttpServer server(LoopbackConfig(3));
  EXPECT_EQ(server.nbThreads(), 3U);
  EXPECT_NE(server.port(), 0);
  EXPECT_EQ(server.config().maxConnections, 3U * 50U * 11U / 10U);
  EXPECT_TRUE(server.config().reusePort);

  auto handle = server.start();
  EXPECT_TRUE(handle.started());
  for (int requestPos = 0; requestPos < 30; ++requestPos) {
    EXPECT_EQ(test::simpleGet(server.port(), requestPos % 2 == 0 ? "/" : "/async").statusCode, 200);
  }
  EXPECT_EQ(server.coordinator().stats().nbDispatched.load(), 30U);
  EXPECT_EQ(server.coordinator().stats().nbAsync.load(), 15U);
  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}

TEST_F(MultiHttpServerTest, InfoDescribesRunningServer) {
  {
    MultiHttpServer server(LoopbackConfig(2));
    auto handle = server.start();
    const auto resp = test::simpleGet(server.port(), "/info");
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_NE(resp.body.find("running on 127.0.0.1:" + std::to_string(server.port())), std::string::npos);
    EXPECT_NE(resp.body.find("worker threads: 2"), std::string::npos);
    EXPECT_NE(resp.body.find("routes: 3 (1 async)"), std::string::npos);
  }
  const std::string description = [] {
    ExecutionLock lock;
    return ServerDescription();
  }();
  EXPECT_NE(description.find("(not started)"), std::string::npos);
}

TEST_F(MultiHttpServerTest, RegistryIsFrozen) {
  MultiHttpServer server(LoopbackConfig(1));
  EXPECT_TRUE(DefaultRegistry().frozen());
  EXPECT_THROW(test::RunPython(R"py(
import turbo
turbo.add_route("GET", "/late", lambda: "late")
)py"),
               PythonException);
}

TEST_F(MultiHttpServerTest, ApplicationRateLimitSettings) {
  test::RunPython("import turbo\nturbo.configure_rate_limiting(True, 2)\n");
  MultiHttpServer server(LoopbackConfig(2));
  EXPECT_TRUE(server.rateLimiter().enabled());
  EXPECT_EQ(server.rateLimiter().config().requestsPerMinute, 2U);

  auto handle = server.start();
  // the limit is shared by all reactors
  EXPECT_EQ(test::simpleGet(server.port(), "/").statusCode, 200);
  EXPECT_EQ(test::simpleGet(server.port(), "/").statusCode, 200);
  EXPECT_EQ(test::simpleGet(server.port(), "/").statusCode, 429);
  EXPECT_EQ(test::simpleGet(server.port(), "/").statusCode, 429);
}

TEST_F(MultiHttpServerTest, ServerRateLimitTakesPrecedence) {
  test::RunPython("import turbo\nturbo.configure_rate_limiting(True, 2)\n");
  RateLimitConfig rateLimit;
  rateLimit.enabled = true;
  rateLimit.requestsPerMinute = 100;
  MultiHttpServer server(LoopbackConfig(1).withRateLimit(rateLimit));
  EXPECT_EQ(server.rateLimiter().config().requestsPerMinute, 100U);
}

TEST_F(MultiHttpServerTest, InvalidConfiguration) {
  EXPECT_THROW(MultiHttpServer(LoopbackConfig(1).withBindAddress("300.1.1.1")), std::invalid_argument);
}

TEST_F(MultiHttpServerTest, PortInUse) {
  MultiHttpServer first(LoopbackConfig(1));
  EXPECT_THROW(MultiHttpServer(LoopbackConfig(2).withPort(first.port())), std::system_error);
}

TEST_F(MultiHttpServerTest, DrainStopsAllReactors) {
  MultiHttpServer server(LoopbackConfig(2));
  auto handle = server.start();
  test::ClientConnection cnx(server.port());
  test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  ASSERT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).statusCode, 200);

  server.beginDrain(500ms);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}

}  // namespace turbo

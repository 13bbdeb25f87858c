#include "turbo/http-server.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <chrono>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "turbo/execution-coordinator.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-server-config.hpp"
#include "turbo/python-test-env.hpp"
#include "turbo/rate-limiter.hpp"
#include "turbo/test-server.hpp"
#include "turbo/test-util.hpp"
#include "turbo/turbo-module.hpp"

namespace turbo {

namespace {

using namespace std::chrono_literals;

const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);

constexpr const char* kApp = R"py(
import turbo

calls = 0

@turbo.get("/")
def root():
    global calls
    calls += 1
    return {"message": "hello"}

@turbo.get("/items/{item_id}")
def get_item(item_id: int, q: str = None):
    return {"id": item_id, "q": q}

@turbo.post("/echo")
def echo(request):
    return request["body"]

@turbo.get("/text")
def text():
    return "plain"

@turbo.get("/boom")
def boom():
    raise ValueError("boom")

@turbo.get("/headers")
def headers(request):
    return request["headers"].get("x-custom", "absent")
)py";

class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test::ResetTurboModule();
    test::RunPython(kApp);
  }

  void TearDown() override { test::ResetTurboModule(); }
};

std::string KeepAliveGet(std::string_view target) {
  return std::string("GET ").append(target).append(" HTTP/1.1\r\nHost: localhost\r\n\r\n");
}

}  // namespace

TEST_F(HttpServerTest, SimpleGet) {
  test::TestServer ts;
  const test::ParsedResponse resp = test::simpleGet(ts.port(), "/");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(resp.body, R"({"message": "hello"})");
  EXPECT_EQ(resp.header("Content-Type"), "application/json");
  EXPECT_EQ(resp.header("Content-Length"), "20");
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_EQ(resp.header("Server"), "turbo");
  EXPECT_TRUE(resp.header("Date"));
}

TEST_F(HttpServerTest, PathAndQueryParameters) {
  test::TestServer ts;
  test::ParsedResponse resp = test::simpleGet(ts.port(), "/items/7?q=hello%20world");
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, R"({"id": 7, "q": "hello world"})");

  resp = test::simpleGet(ts.port(), "/items/seven");
  EXPECT_EQ(resp.statusCode, 422);

  resp = test::simpleGet(ts.port(), "/items/7/");
  EXPECT_EQ(resp.statusCode, 404);
}

TEST_F(HttpServerTest, RequestBodyAndHeaders) {
  test::TestServer ts;
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/echo";
  opt.body = "some payload";
  test::ParsedResponse resp = test::requestParsed(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, "some payload");

  opt = {};
  opt.target = "/headers";
  opt.headers.emplace_back("X-Custom", "value");
  resp = test::requestParsed(ts.port(), opt);
  EXPECT_EQ(resp.body, "value");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  for (int requestPos = 0; requestPos < 3; ++requestPos) {
    test::sendAll(cnx.fd(), KeepAliveGet("/text"));
    const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body, "plain");
    EXPECT_EQ(resp.header("Connection"), "keep-alive");
  }
}

TEST_F(HttpServerTest, PipelinedRequestsAnsweredInOrder) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  test::setRecvTimeout(cnx.fd(), 2s);
  const std::string requests = KeepAliveGet("/items/1") + KeepAliveGet("/items/2") +
                               "GET /items/3 HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n";
  test::sendAll(cnx.fd(), requests);
  const std::string raw = test::recvUntilClosed(cnx.fd());
  EXPECT_EQ(test::countOccurrences(raw, "HTTP/1.1 200"), 3);
  const auto first = raw.find(R"({"id": 1)");
  const auto second = raw.find(R"({"id": 2)");
  const auto third = raw.find(R"({"id": 3)");
  ASSERT_NE(third, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
}

TEST_F(HttpServerTest, MaxRequestsPerConnection) {
  test::TestServer ts(HttpServerConfig{}.withMaxRequestsPerConnection(2));
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), KeepAliveGet("/text"));
  auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.header("Connection"), "keep-alive");
  test::sendAll(cnx.fd(), KeepAliveGet("/text"));
  resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST_F(HttpServerTest, KeepAliveDisabled) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveMode(false));
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), KeepAliveGet("/text"));
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST_F(HttpServerTest, Http10ClosesByDefault) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  test::setRecvTimeout(cnx.fd(), 2s);
  test::sendAll(cnx.fd(), "GET /text HTTP/1.0\r\n\r\n");
  const auto resp = test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd()));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Connection"), "close");
  EXPECT_EQ(resp.body, "plain");
}

TEST_F(HttpServerTest, HeadHasNoBody) {
  test::TestServer ts;
  test::RequestOptions opt;
  opt.method = "HEAD";
  opt.target = "/text";
  const std::string raw = test::request(ts.port(), opt);
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.header("Content-Length"), "5");
  EXPECT_TRUE(raw.ends_with("\r\n\r\n"));
  EXPECT_EQ(raw.find("plain"), std::string::npos);
}

TEST_F(HttpServerTest, ExpectContinue) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(),
                "POST /echo HTTP/1.1\r\nHost: localhost\r\nContent-Length: 5\r\nExpect: 100-continue\r\n"
                "Connection: close\r\n\r\n");
  const std::string interim = test::recvWithTimeout(cnx.fd(), 200ms);
  EXPECT_TRUE(interim.starts_with("HTTP/1.1 100 Continue\r\n\r\n"));
  test::sendAll(cnx.fd(), "hello");
  test::setRecvTimeout(cnx.fd(), 2s);
  const auto resp = test::parseResponseOrThrow(interim + test::recvUntilClosed(cnx.fd()));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(resp.body, "hello");
}

TEST_F(HttpServerTest, RoutingErrors) {
  test::TestServer ts;
  test::ParsedResponse resp = test::simpleGet(ts.port(), "/unknown");
  EXPECT_EQ(resp.statusCode, 404);
  EXPECT_EQ(resp.header("Content-Type"), "application/json");

  test::RequestOptions opt;
  opt.method = "DELETE";
  opt.target = "/";
  resp = test::requestParsed(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, 405);
  EXPECT_EQ(resp.header("Allow"), "GET, HEAD");
}

TEST_F(HttpServerTest, ProtocolErrors) {
  test::TestServer ts(HttpServerConfig{}.withMaxHeaderBytes(256).withMaxBodyBytes(16));
  const auto send = [&ts](std::string_view raw) {
    test::ClientConnection cnx(ts.port());
    test::setRecvTimeout(cnx.fd(), 2s);
    test::sendAll(cnx.fd(), raw);
    return test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd()));
  };

  auto resp = send("GET  / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(resp.statusCode, 400);
  EXPECT_EQ(resp.header("Connection"), "close");

  resp = send("POST /echo HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n");
  EXPECT_EQ(resp.statusCode, 501);

  resp = send("GET / HTTP/1.1\r\nX-Big: " + std::string(512, 'a') + "\r\n\r\n");
  EXPECT_EQ(resp.statusCode, 431);

  resp = send("POST /echo HTTP/1.1\r\nHost: x\r\nContent-Length: 100\r\n\r\n");
  EXPECT_EQ(resp.statusCode, 413);

  resp = send("GET / HTTP/2.0\r\n\r\n");
  EXPECT_EQ(resp.statusCode, 505);

  // server still healthy
  EXPECT_EQ(test::simpleGet(ts.port(), "/").statusCode, 200);
}

TEST_F(HttpServerTest, RaisingHandlerKeepsConnectionUsable) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), KeepAliveGet("/boom"));
  auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, 500);
  EXPECT_EQ(resp.header("Connection"), "keep-alive");

  test::sendAll(cnx.fd(), KeepAliveGet("/"));
  resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, 200);
  EXPECT_EQ(ts.coordinator().stats().nbHandlerErrors.load(), 1U);
}

TEST_F(HttpServerTest, MaxConnectionsAnswers503) {
  test::TestServer ts(HttpServerConfig{}.withMaxConnections(1));
  test::ClientConnection first(ts.port());
  test::sendAll(first.fd(), KeepAliveGet("/text"));
  ASSERT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(first.fd())).statusCode, 200);

  test::ClientConnection second(ts.port());
  test::setRecvTimeout(second.fd(), 2s);
  const auto resp = test::parseResponseOrThrow(test::recvUntilClosed(second.fd()));
  EXPECT_EQ(resp.statusCode, 503);

  // the first connection is unaffected
  test::sendAll(first.fd(), KeepAliveGet("/text"));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(first.fd())).statusCode, 200);
}

TEST_F(HttpServerTest, RateLimiting) {
  RateLimitConfig rateLimit;
  rateLimit.enabled = true;
  rateLimit.requestsPerMinute = 3;
  test::TestServer ts(HttpServerConfig{}.withRateLimit(rateLimit));
  for (int requestPos = 0; requestPos < 3; ++requestPos) {
    EXPECT_EQ(test::simpleGet(ts.port(), "/text").statusCode, 200);
  }
  test::ParsedResponse resp = test::simpleGet(ts.port(), "/text");
  EXPECT_EQ(resp.statusCode, 429);
  EXPECT_EQ(resp.header("Retry-After"), "60");

  test::RequestOptions opt;
  opt.target = "/text";
  opt.headers.emplace_back("X-Forwarded-For", "203.0.113.7");
  resp = test::requestParsed(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, 200);
}

TEST_F(HttpServerTest, GlobalHeaders) {
  test::TestServer ts(HttpServerConfig{}.withGlobalHeaders({{"X-Frame-Options", "DENY"}}));
  const auto resp = test::simpleGet(ts.port(), "/text");
  EXPECT_EQ(resp.header("X-Frame-Options"), "DENY");
  EXPECT_FALSE(resp.header("Server"));
}

TEST_F(HttpServerTest, IdleConnectionsAreClosed) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveTimeout(50ms));
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), KeepAliveGet("/text"));
  ASSERT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).statusCode, 200);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));

  // incomplete requests are bounded too
  test::ClientConnection slowClient(ts.port());
  test::sendAll(slowClient.fd(), "GET / HTTP/1.1\r\nHost: loc");
  EXPECT_TRUE(test::WaitForPeerClose(slowClient.fd(), 1s));
}

TEST_F(HttpServerTest, DrainClosesKeepAliveConnections) {
  test::TestServer ts;
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), KeepAliveGet("/text"));
  ASSERT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).statusCode, 200);

  ts.server().beginDrain(1s);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));

  const auto deadline = std::chrono::steady_clock::now() + 1s;
  while (ts.server().isRunning() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_FALSE(ts.server().isRunning());
  EXPECT_NO_THROW(ts.stop());
}

TEST_F(HttpServerTest, StopIsIdempotent) {
  test::TestServer ts;
  EXPECT_EQ(test::simpleGet(ts.port(), "/").statusCode, 200);
  ts.stop();
  ts.stop();
  EXPECT_FALSE(ts.server().isRunning());
}

TEST_F(HttpServerTest, ManyClientsInParallel) {
  test::TestServer ts;
  constexpr int kNbClients = 8;
  constexpr int kNbRequestsPerClient = 20;
  std::vector<int> nbOk(kNbClients, 0);
  {
    std::vector<std::jthread> clients;
    for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
      clients.emplace_back([&ts, &nbOk, clientPos] {
        test::ClientConnection cnx(ts.port());
        for (int requestPos = 0; requestPos < kNbRequestsPerClient; ++requestPos) {
          test::sendAll(cnx.fd(), KeepAliveGet("/items/" + std::to_string(requestPos)));
          const auto resp = test::parseResponse(test::recvWithTimeout(cnx.fd(), 2000ms));
          if (resp && resp->statusCode == 200) {
            ++nbOk[clientPos];
          }
        }
      });
    }
  }
  for (int ok : nbOk) {
    EXPECT_EQ(ok, kNbRequestsPerClient);
  }
}

}  // namespace turbo

#include "turbo/rate-limiter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "turbo/http-method.hpp"
#include "turbo/request-context.hpp"
#include "turbo/timedef.hpp"

namespace turbo {

namespace {

RateLimiter MakeLimiter(uint32_t requestsPerMinute) {
  RateLimitConfig config;
  config.enabled = true;
  config.requestsPerMinute = requestsPerMinute;
  return RateLimiter(config);
}

}  // namespace

TEST(RateLimitConfig, Validate) {
  RateLimitConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_FALSE(config.enabled);
  EXPECT_EQ(config.requestsPerMinute, 1000000U);

  config.enabled = true;
  config.requestsPerMinute = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.enabled = false;
  EXPECT_NO_THROW(config.validate());
}

TEST(RateLimiter, DisabledAlwaysAllows) {
  RateLimiter limiter;
  EXPECT_FALSE(limiter.enabled());
  for (int requestPos = 0; requestPos < 100; ++requestPos) {
    EXPECT_TRUE(limiter.allow("1.2.3.4"));
  }
  EXPECT_EQ(limiter.nbClients(), 0U);
}

TEST(RateLimiter, LimitsWithinWindow) {
  RateLimiter limiter = MakeLimiter(3);
  const SteadyTimePoint now = std::chrono::steady_clock::now();
  EXPECT_TRUE(limiter.allow("client", now));
  EXPECT_TRUE(limiter.allow("client", now));
  EXPECT_TRUE(limiter.allow("client", now));
  EXPECT_FALSE(limiter.allow("client", now));
  EXPECT_FALSE(limiter.allow("client", now + std::chrono::seconds{59}));
  // other clients have their own window
  EXPECT_TRUE(limiter.allow("other", now));
  EXPECT_EQ(limiter.nbClients(), 2U);
}

TEST(RateLimiter, WindowResetsAfterOneMinute) {
  RateLimiter limiter = MakeLimiter(1);
  const SteadyTimePoint start = std::chrono::steady_clock::now();
  EXPECT_TRUE(limiter.allow("client", start));
  EXPECT_FALSE(limiter.allow("client", start + std::chrono::seconds{60}));
  EXPECT_TRUE(limiter.allow("client", start + std::chrono::seconds{61}));
  EXPECT_FALSE(limiter.allow("client", start + std::chrono::seconds{62}));
}

TEST(RateLimiter, PrunesExpiredWindows) {
  RateLimiter limiter = MakeLimiter(10);
  const SteadyTimePoint start = std::chrono::steady_clock::now();
  for (std::size_t clientPos = 0; clientPos < RateLimiter::kPruneThreshold; ++clientPos) {
    limiter.allow(std::to_string(clientPos), start);
  }
  EXPECT_EQ(limiter.nbClients(), RateLimiter::kPruneThreshold);

  // one more client, long after: the table exceeds the threshold and all the old windows expired
  limiter.allow("late", start + std::chrono::minutes{2});
  EXPECT_EQ(limiter.nbClients(), 1U);
}

TEST(RateLimiter, ClientKey) {
  RequestContext ctx(http::Method::GET, "/");
  ctx.setPeerAddress("10.0.0.1");
  EXPECT_EQ(RateLimiter::ClientKey(ctx), "10.0.0.1");

  ctx.addHeader("X-Real-IP", " 192.168.1.7 ");
  EXPECT_EQ(RateLimiter::ClientKey(ctx), "192.168.1.7");

  ctx.addHeader("x-forwarded-for", "203.0.113.5, 70.41.3.18, 150.172.238.178");
  EXPECT_EQ(RateLimiter::ClientKey(ctx), "203.0.113.5");
}

TEST(RateLimiter, EmptyForwardedForFallsBack) {
  RequestContext ctx(http::Method::GET, "/");
  ctx.setPeerAddress("10.0.0.1");
  ctx.addHeader("X-Forwarded-For", " , 1.1.1.1");
  EXPECT_EQ(RateLimiter::ClientKey(ctx), "10.0.0.1");
}

}  // namespace turbo

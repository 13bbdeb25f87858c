#include "turbo/http-error.hpp"

#include <gtest/gtest.h>

#include "turbo/http-constants.hpp"
#include "turbo/http-method.hpp"
#include "turbo/http-status-code.hpp"

namespace turbo {

TEST(HttpError, DefaultStatusPerKind) {
  EXPECT_EQ(DefaultStatusCode(ErrorKind::RouteNotFound), http::StatusCodeNotFound);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::MethodNotAllowed), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::HandlerException), http::StatusCodeInternalServerError);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::ValidationError), http::StatusCodeUnprocessableEntity);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::TimedOut), http::StatusCodeGatewayTimeout);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::BridgeUnavailable), http::StatusCodeServiceUnavailable);
  EXPECT_EQ(DefaultStatusCode(ErrorKind::RateLimited), http::StatusCodeTooManyRequests);
}

TEST(HttpError, NotFoundBody) {
  const auto resp =
      MakeErrorResponse(MakeFailure(ErrorKind::RouteNotFound, "No route for /x"), http::Method::GET, "/x");
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.body(),
            R"({"error": "Not Found", "message": "No route for /x", "method": "GET", "path": "/x"})");
}

TEST(HttpError, ValidationDetailAppended) {
  const auto resp = MakeErrorResponse(
      MakeFailure(ErrorKind::ValidationError, "Validation failed",
                  R"([{"loc": ["path", "id"], "msg": "value is not a valid integer", "type": "int_parsing"}])"),
      http::Method::GET, "/items/abc");
  EXPECT_EQ(resp.status(), http::StatusCodeUnprocessableEntity);
  EXPECT_EQ(resp.body(),
            R"({"error": "Unprocessable Entity", "message": "Validation failed", "method": "GET", )"
            R"("path": "/items/abc", "detail": [{"loc": ["path", "id"], "msg": "value is not a valid integer", )"
            R"("type": "int_parsing"}]})");
}

TEST(HttpError, MessageAndPathEscaped) {
  const auto resp = MakeErrorResponse(MakeFailure(ErrorKind::HandlerException, "bad \"quote\"\n"),
                                      http::Method::POST, "/a\\b");
  EXPECT_EQ(resp.body(),
            R"({"error": "Internal Server Error", "message": "bad \"quote\"\n", "method": "POST", "path": "/a\\b"})");
}

TEST(HttpError, CarriedStatusUsesItsReason) {
  Failure failure = MakeFailure(ErrorKind::HandlerException, "teapot");
  failure.status = 418;
  const auto resp = MakeErrorResponse(failure, http::Method::GET, "/tea");
  EXPECT_EQ(resp.status(), 418);
  EXPECT_TRUE(resp.body().starts_with(R"({"error": "I'm a teapot")"));
}

TEST(HttpError, UnregisteredStatusFallsBackToKindName) {
  Failure failure = MakeFailure(ErrorKind::HandlerException, "custom");
  failure.status = 499;
  const auto resp = MakeErrorResponse(failure, http::Method::GET, "/");
  EXPECT_TRUE(resp.body().starts_with(R"({"error": "HandlerException")"));
}

TEST(HttpError, MethodNotAllowedHasAllowHeader) {
  const auto resp =
      MakeMethodNotAllowedResponse(http::Method::GET | http::Method::HEAD, http::Method::DELETE, "/items/1");
  EXPECT_EQ(resp.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow), "GET, HEAD");
}

TEST(HttpError, RateLimitedBody) {
  const auto resp = MakeRateLimitedResponse(60);
  EXPECT_EQ(resp.status(), http::StatusCodeTooManyRequests);
  EXPECT_EQ(resp.headerValue(http::RetryAfter), "60");
  EXPECT_EQ(resp.body(), R"({"error": "RateLimitExceeded", "message": "Too many requests", "retry_after": 60})");
}

TEST(HttpError, ProtocolError) {
  const auto resp = MakeProtocolErrorResponse(http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(resp.status(), http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(resp.body(), R"({"error": "Request Header Fields Too Large"})");
}

}  // namespace turbo

#include "turbo/router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "turbo/http-method.hpp"

namespace turbo {

using http::Method;

class RouterTest : public ::testing::Test {
 protected:
  Router::MatchResult match(Method method, std::string_view path) { return router.match(method, path, buffer); }

  Router router;
  Router::MatchBuffer buffer;
};

TEST_F(RouterTest, LiteralRoute) {
  const auto [routeId, inserted] = router.add(Method::GET, "/hello");
  EXPECT_TRUE(inserted);

  const auto res = match(Method::GET, "/hello");
  ASSERT_EQ(res.status, Router::MatchResult::Status::Found);
  EXPECT_EQ(res.routeId, routeId);
  EXPECT_TRUE(res.pathParams.empty());

  EXPECT_EQ(match(Method::GET, "/hell").status, Router::MatchResult::Status::NotFound);
  EXPECT_EQ(match(Method::GET, "/hello/world").status, Router::MatchResult::Status::NotFound);
}

TEST_F(RouterTest, RootRoute) {
  const auto root = router.add(Method::GET, "/").routeId;
  EXPECT_EQ(match(Method::GET, "/").routeId, root);
  EXPECT_EQ(match(Method::GET, "/x").status, Router::MatchResult::Status::NotFound);
}

TEST_F(RouterTest, ParameterCaptured) {
  const auto routeId = router.add(Method::GET, "/items/{id}").routeId;

  const auto res = match(Method::GET, "/items/42");
  ASSERT_EQ(res.status, Router::MatchResult::Status::Found);
  EXPECT_EQ(res.routeId, routeId);
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams[0].key, "id");
  EXPECT_EQ(res.pathParams[0].value, "42");
  ASSERT_EQ(router.paramNames(routeId).size(), 1U);
  EXPECT_EQ(router.paramNames(routeId)[0], "id");
}

TEST_F(RouterTest, ParameterNeverMatchesEmptySegment) {
  router.add(Method::GET, "/items/{id}");
  EXPECT_EQ(match(Method::GET, "/items/").status, Router::MatchResult::Status::NotFound);
  EXPECT_EQ(match(Method::GET, "/items").status, Router::MatchResult::Status::NotFound);
}

TEST_F(RouterTest, MultipleParameters) {
  router.add(Method::GET, "/users/{userId}/posts/{postId}");
  const auto res = match(Method::GET, "/users/7/posts/abc");
  ASSERT_EQ(res.status, Router::MatchResult::Status::Found);
  ASSERT_EQ(res.pathParams.size(), 2U);
  EXPECT_EQ(res.pathParams[0].key, "userId");
  EXPECT_EQ(res.pathParams[0].value, "7");
  EXPECT_EQ(res.pathParams[1].key, "postId");
  EXPECT_EQ(res.pathParams[1].value, "abc");
}

TEST_F(RouterTest, LiteralWinsOverParameterRegardlessOfOrder) {
  const auto param = router.add(Method::GET, "/users/{id}").routeId;
  const auto literal = router.add(Method::GET, "/users/me").routeId;

  auto res = match(Method::GET, "/users/me");
  EXPECT_EQ(res.routeId, literal);
  EXPECT_TRUE(res.pathParams.empty());

  res = match(Method::GET, "/users/you");
  EXPECT_EQ(res.routeId, param);
}

TEST_F(RouterTest, LiteralWinsAtDeeperLevel) {
  const auto deepParam = router.add(Method::GET, "/a/{x}/{y}").routeId;
  const auto deepLiteral = router.add(Method::GET, "/a/{x}/c").routeId;
  EXPECT_EQ(match(Method::GET, "/a/b/c").routeId, deepLiteral);
  EXPECT_EQ(match(Method::GET, "/a/b/d").routeId, deepParam);
}

TEST_F(RouterTest, BacktracksFromLiteralDeadEnd) {
  router.add(Method::GET, "/files/static/index");
  const auto param = router.add(Method::GET, "/files/{name}/raw").routeId;

  const auto res = match(Method::GET, "/files/static/raw");
  ASSERT_EQ(res.status, Router::MatchResult::Status::Found);
  EXPECT_EQ(res.routeId, param);
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams[0].value, "static");
}

TEST_F(RouterTest, WildcardMatchesRemainingSegments) {
  const auto wildcard = router.add(Method::GET, "/static/*").routeId;
  const auto exact = router.add(Method::GET, "/static/favicon.ico").routeId;

  EXPECT_EQ(match(Method::GET, "/static/css/site.css").routeId, wildcard);
  EXPECT_EQ(match(Method::GET, "/static/favicon.ico").routeId, exact);
  EXPECT_EQ(match(Method::GET, "/static").status, Router::MatchResult::Status::NotFound);
}

TEST_F(RouterTest, TrailingSlashIsSignificant) {
  const auto noSlash = router.add(Method::GET, "/a").routeId;
  const auto slash = router.add(Method::GET, "/a/").routeId;
  EXPECT_NE(noSlash, slash);
  EXPECT_EQ(match(Method::GET, "/a").routeId, noSlash);
  EXPECT_EQ(match(Method::GET, "/a/").routeId, slash);
}

TEST_F(RouterTest, DuplicateKeepsFirst) {
  const auto first = router.add(Method::POST, "/items/{id}");
  const auto second = router.add(Method::POST, "/items/{other}");
  EXPECT_TRUE(first.inserted);
  EXPECT_FALSE(second.inserted);
  EXPECT_EQ(second.routeId, first.routeId);
  EXPECT_EQ(router.nbRoutes(), 1U);

  const auto res = match(Method::POST, "/items/3");
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams[0].key, "id");
}

TEST_F(RouterTest, SameShapeDifferentMethodsKeepTheirOwnNames) {
  router.add(Method::GET, "/items/{id}");
  router.add(Method::DELETE, "/items/{itemId}");
  const auto res = match(Method::DELETE, "/items/9");
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams[0].key, "itemId");
}

TEST_F(RouterTest, HeadFallsBackToGet) {
  const auto get = router.add(Method::GET, "/doc").routeId;
  EXPECT_EQ(match(Method::HEAD, "/doc").routeId, get);

  const auto head = router.add(Method::HEAD, "/doc").routeId;
  EXPECT_EQ(match(Method::HEAD, "/doc").routeId, head);
}

TEST_F(RouterTest, MethodNotAllowedReportsAllowedMethods) {
  router.add(Method::GET, "/items/{id}");
  router.add(Method::PUT, "/items/{id}");

  const auto res = match(Method::POST, "/items/1");
  EXPECT_EQ(res.status, Router::MatchResult::Status::MethodNotAllowed);
  EXPECT_EQ(res.routeId, kInvalidRouteId);
  EXPECT_EQ(res.allowedMethods, Method::GET | Method::HEAD | Method::PUT);
  EXPECT_EQ(http::MethodBmpToAllowValue(res.allowedMethods), "GET, HEAD, PUT");
}

TEST_F(RouterTest, MethodNotAllowedOnWildcard) {
  router.add(Method::POST, "/upload/*");
  const auto res = match(Method::GET, "/upload/a/b");
  EXPECT_EQ(res.status, Router::MatchResult::Status::MethodNotAllowed);
  EXPECT_EQ(res.allowedMethods, static_cast<http::MethodBmp>(Method::POST));
}

TEST_F(RouterTest, RelativePathNeverMatches) {
  router.add(Method::GET, "/");
  EXPECT_EQ(match(Method::GET, "").status, Router::MatchResult::Status::NotFound);
  EXPECT_EQ(match(Method::GET, "*").status, Router::MatchResult::Status::NotFound);
}

TEST_F(RouterTest, MatchBufferReusedAcrossCalls) {
  router.add(Method::GET, "/a/{x}");
  router.add(Method::GET, "/b/{y}/{z}");
  EXPECT_EQ(match(Method::GET, "/b/1/2").pathParams.size(), 2U);
  const auto res = match(Method::GET, "/a/3");
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams[0].key, "x");
  EXPECT_EQ(res.pathParams[0].value, "3");
}

TEST_F(RouterTest, InvalidPatternsThrow) {
  EXPECT_THROW(router.add(Method::GET, ""), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "items"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/{}"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/{id"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/id}"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/pre{id}"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/{1id}"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/items/{id}/{id}"), std::invalid_argument);
  EXPECT_THROW(router.add(Method::GET, "/static/*/more"), std::invalid_argument);
  EXPECT_EQ(router.nbRoutes(), 0U);
}

}  // namespace turbo

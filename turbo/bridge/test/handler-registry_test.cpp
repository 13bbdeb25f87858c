#include "turbo/handler-registry.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "turbo/execution-lock.hpp"
#include "turbo/handler-entry.hpp"
#include "turbo/http-method.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-error.hpp"
#include "turbo/python-test-env.hpp"
#include "turbo/router.hpp"

namespace turbo {

namespace {

const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);

constexpr const char* kHandlers = R"py(
from __future__ import annotations

def sync_handler(item_id: int, flag: bool = True, *args, **kwargs):
    return {"item_id": item_id}

async def async_handler(name: str, payload: dict[str, int], data: bytes, request):
    return name

def positional_only(a, /, b):
    pass

class Callable:
    def __call__(self, x: float):
        return x

instance = Callable()
not_callable = 3
)py";

class HandlerRegistryTest : public ::testing::Test {
 protected:
  const HandlerEntry& add(http::Method method, const char* pattern, const char* name) {
    PyRef fn = test::GetGlobal(globals, name);
    ExecutionLock lock;
    return registry.add(method, pattern, fn.get());
  }

  void TearDown() override {
    ExecutionLock lock;
    registry.clear();
  }

  PyRef globals = test::RunPython(kHandlers);
  HandlerRegistry registry;
};

}  // namespace

TEST_F(HandlerRegistryTest, IntrospectsSyncHandler) {
  const HandlerEntry& entry = add(http::Method::GET, "/items/{item_id}", "sync_handler");
  EXPECT_EQ(entry.name, "sync_handler");
  EXPECT_FALSE(entry.isAsync());
  EXPECT_EQ(entry.pathPattern, "/items/{item_id}");
  ASSERT_EQ(entry.params.size(), 2U);
  EXPECT_EQ(entry.params[0].name, "item_id");
  EXPECT_EQ(entry.params[0].kind, ParamKind::Int);
  EXPECT_TRUE(entry.params[0].required());
  EXPECT_EQ(entry.params[1].name, "flag");
  EXPECT_EQ(entry.params[1].kind, ParamKind::Bool);
  EXPECT_FALSE(entry.params[1].required());
  EXPECT_EQ(registry.nbAsync(), 0U);
}

TEST_F(HandlerRegistryTest, IntrospectsAsyncHandlerWithStringAnnotations) {
  const HandlerEntry& entry = add(http::Method::POST, "/async/{name}", "async_handler");
  EXPECT_TRUE(entry.isAsync());
  ASSERT_EQ(entry.params.size(), 4U);
  EXPECT_EQ(entry.params[0].kind, ParamKind::Str);
  EXPECT_EQ(entry.params[1].kind, ParamKind::JsonBody);
  EXPECT_EQ(entry.params[2].kind, ParamKind::RawBody);
  EXPECT_EQ(entry.params[3].kind, ParamKind::Request);
  EXPECT_EQ(registry.nbAsync(), 1U);
}

TEST_F(HandlerRegistryTest, CallableObject) {
  const HandlerEntry& entry = add(http::Method::GET, "/call", "instance");
  EXPECT_FALSE(entry.isAsync());
  ASSERT_EQ(entry.params.size(), 1U);
  EXPECT_EQ(entry.params[0].kind, ParamKind::Float);
}

TEST_F(HandlerRegistryTest, RoutesResolveToEntries) {
  add(http::Method::GET, "/items/{item_id}", "sync_handler");
  add(http::Method::POST, "/async/{name}", "async_handler");
  EXPECT_EQ(registry.size(), 2U);

  Router::MatchBuffer buffer;
  const auto res = registry.router().match(http::Method::POST, "/async/bob", buffer);
  ASSERT_EQ(res.status, Router::MatchResult::Status::Found);
  EXPECT_EQ(registry.entry(res.routeId).name, "async_handler");
}

TEST_F(HandlerRegistryTest, DuplicateKeepsFirstHandler) {
  const HandlerEntry& first = add(http::Method::GET, "/dup", "sync_handler");
  const HandlerEntry& second = add(http::Method::GET, "/dup", "instance");
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(second.name, "sync_handler");
  EXPECT_EQ(registry.size(), 1U);
}

TEST_F(HandlerRegistryTest, RejectsInvalidHandlers) {
  EXPECT_THROW(add(http::Method::GET, "/x", "not_callable"), std::invalid_argument);
  EXPECT_THROW(add(http::Method::GET, "/x", "positional_only"), std::invalid_argument);
  EXPECT_THROW(add(http::Method::GET, "no-slash", "sync_handler"), std::invalid_argument);
  EXPECT_TRUE(registry.empty());
}

TEST_F(HandlerRegistryTest, FrozenRegistryRejectsRegistration) {
  add(http::Method::GET, "/a", "sync_handler");
  registry.freeze();
  EXPECT_TRUE(registry.frozen());
  try {
    add(http::Method::GET, "/b", "sync_handler");
    FAIL() << "expected std::logic_error";
  } catch (const std::invalid_argument&) {
    FAIL() << "unexpected std::invalid_argument";
  } catch (const std::logic_error&) {
    SUCCEED();
  }
  EXPECT_EQ(registry.size(), 1U);
}

TEST_F(HandlerRegistryTest, DescribeAndClear) {
  add(http::Method::GET, "/items/{item_id}", "sync_handler");
  add(http::Method::POST, "/async/{name}", "async_handler");
  EXPECT_EQ(registry.describe(),
            "GET /items/{item_id} -> sync_handler (sync)\n"
            "POST /async/{name} -> async_handler (async)\n");
  registry.freeze();
  {
    ExecutionLock lock;
    registry.clear();
  }
  EXPECT_TRUE(registry.empty());
  EXPECT_FALSE(registry.frozen());
  EXPECT_EQ(registry.router().nbRoutes(), 0U);
}

}  // namespace turbo

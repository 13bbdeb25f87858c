#include "turbo/param-binder.hpp"

#include <gtest/gtest.h>

#include <utility>

#include <string>
#include <vector>

#include "turbo/execution-lock.hpp"
#include "turbo/handler-entry.hpp"
#include "turbo/handler-registry.hpp"
#include "turbo/http-method.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-test-env.hpp"
#include "turbo/request-context.hpp"

namespace turbo {

namespace {

const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);

constexpr const char* kHandlers = R"py(
def get_item(item_id: int, q: str = None, verbose: bool = False, ratio: float = 1.0):
    pass

def untyped(name, limit=10):
    pass

def create(payload: dict, request):
    pass

def optional_body(payload: dict = None):
    pass

def raw(data: bytes):
    pass
)py";

class ParamBinderTest : public ::testing::Test {
 protected:
  const HandlerEntry& add(const char* name, const char* pattern, http::Method method = http::Method::GET) {
    PyRef fn = test::GetGlobal(globals, name);
    ExecutionLock lock;
    return registry.add(method, pattern, fn.get());
  }

  // repr() of kwargs[name]
  static std::string reprOf(const BindResult& result, const char* name) {
    ExecutionLock lock;
    PyObject* value = PyDict_GetItemString(result.kwargs.get(), name);
    if (value == nullptr) {
      return "<absent>";
    }
    PyRef repr = PyRef::Steal(PyObject_Repr(value));
    return PyUnicode_AsUTF8(repr.get());
  }

  static BindResult bind(const HandlerEntry& entry, const RequestContext& ctx) {
    ExecutionLock lock;
    return BindArguments(entry, ctx);
  }

  void TearDown() override {
    ExecutionLock lock;
    registry.clear();
  }

  PyRef globals = test::RunPython(kHandlers);
  HandlerRegistry registry;
};

}  // namespace

TEST_F(ParamBinderTest, PathParamsAreCoerced) {
  const HandlerEntry& entry = add("get_item", "/items/{item_id}");
  RequestContext ctx(http::Method::GET, "/items/42");
  ctx.addPathParam("item_id", "42");
  ctx.addQueryParam("q", "search");
  ctx.addQueryParam("verbose", "yes");
  ctx.addQueryParam("ratio", "0.5");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "item_id"), "42");
  EXPECT_EQ(reprOf(result, "q"), "'search'");
  EXPECT_EQ(reprOf(result, "verbose"), "True");
  EXPECT_EQ(reprOf(result, "ratio"), "0.5");
}

TEST_F(ParamBinderTest, DefaultsApplyWhenAbsent) {
  const HandlerEntry& entry = add("get_item", "/items/{item_id}");
  RequestContext ctx(http::Method::GET, "/items/7");
  ctx.addPathParam("item_id", "+7");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "item_id"), "7");
  EXPECT_EQ(reprOf(result, "q"), "None");
  EXPECT_EQ(reprOf(result, "verbose"), "False");
  EXPECT_EQ(reprOf(result, "ratio"), "1.0");
}

TEST_F(ParamBinderTest, PathParamsArePercentDecoded) {
  const HandlerEntry& entry = add("untyped", "/users/{name}");
  RequestContext ctx(http::Method::GET, "/users/j%C3%A9r%C3%B4me");
  ctx.addPathParam("name", "j%C3%A9r%C3%B4me");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "name"), "'jérôme'");
  EXPECT_EQ(reprOf(result, "limit"), "10");
}

TEST_F(ParamBinderTest, PathParamWinsOverQuery) {
  const HandlerEntry& entry = add("untyped", "/users/{name}");
  RequestContext ctx(http::Method::GET, "/users/bob");
  ctx.addPathParam("name", "bob");
  ctx.addQueryParam("name", "alice");
  ctx.addQueryParam("limit", "3");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "name"), "'bob'");
  // untyped parameters receive strings
  EXPECT_EQ(reprOf(result, "limit"), "'3'");
}

TEST_F(ParamBinderTest, UntypedIntegerPathSegments) {
  const HandlerEntry& entry = add("untyped", "/users/{name}");
  for (const auto& [segment, expected] : {std::pair<const char*, const char*>{"42", "42"},
                                          {"-3", "-3"},
                                          {"0", "0"},
                                          {"123456789012345678901234567890", "123456789012345678901234567890"},
                                          {"007", "'007'"},
                                          {"-0", "'-0'"},
                                          {"+5", "'+5'"},
                                          {"4e2", "'4e2'"}}) {
    RequestContext ctx(http::Method::GET, "/users");
    ctx.addPathParam("name", segment);
    const BindResult result = bind(entry, ctx);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(reprOf(result, "name"), expected) << segment;
  }
}

TEST_F(ParamBinderTest, CoercionErrorsAreCollected) {
  const HandlerEntry& entry = add("get_item", "/items/{item_id}");
  RequestContext ctx(http::Method::GET, "/items/abc");
  ctx.addPathParam("item_id", "abc");
  ctx.addQueryParam("verbose", "maybe");
  ctx.addQueryParam("ratio", "x1");

  const BindResult result = bind(entry, ctx);
  ASSERT_FALSE(result.ok());
  EXPECT_FALSE(result.kwargs);
  ASSERT_EQ(result.errors.size(), 3U);
  EXPECT_EQ(result.errors[0].source, "path");
  EXPECT_EQ(result.errors[0].name, "item_id");
  EXPECT_EQ(result.errors[0].type, "int_parsing");
  EXPECT_EQ(result.errors[1].source, "query");
  EXPECT_EQ(result.errors[1].type, "bool_parsing");
  EXPECT_EQ(result.errors[2].type, "float_parsing");
}

TEST_F(ParamBinderTest, MissingRequiredParameter) {
  const HandlerEntry& entry = add("untyped", "/search");
  RequestContext ctx(http::Method::GET, "/search");

  const BindResult result = bind(entry, ctx);
  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(result.errors[0].source, "query");
  EXPECT_EQ(result.errors[0].name, "name");
  EXPECT_EQ(result.errors[0].msg, "Field required");
  EXPECT_EQ(result.errors[0].type, "missing");
  EXPECT_EQ(FieldErrorsToJson(result.errors),
            R"([{"loc": ["query", "name"], "msg": "Field required", "type": "missing"}])");
}

TEST_F(ParamBinderTest, JsonBodyAndRequest) {
  const HandlerEntry& entry = add("create", "/items", http::Method::POST);
  RequestContext ctx(http::Method::POST, "/items");
  ctx.addHeader("Content-Type", "application/json");
  ctx.addHeader("X-Custom", "first");
  ctx.addHeader("x-custom", "second");
  ctx.setBody(R"({"name": "widget", "price": 9.5})");
  ctx.setPeerAddress("127.0.0.1");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "payload"), "{'name': 'widget', 'price': 9.5}");

  ExecutionLock lock;
  PyObject* request = PyDict_GetItemString(result.kwargs.get(), "request");
  ASSERT_NE(request, nullptr);
  ASSERT_TRUE(PyDict_Check(request));
  EXPECT_STREQ(PyUnicode_AsUTF8(PyDict_GetItemString(request, "method")), "POST");
  EXPECT_STREQ(PyUnicode_AsUTF8(PyDict_GetItemString(request, "path")), "/items");
  EXPECT_STREQ(PyUnicode_AsUTF8(PyDict_GetItemString(request, "client")), "127.0.0.1");
  PyObject* headers = PyDict_GetItemString(request, "headers");
  ASSERT_NE(headers, nullptr);
  EXPECT_STREQ(PyUnicode_AsUTF8(PyDict_GetItemString(headers, "x-custom")), "first");
  EXPECT_TRUE(PyBytes_Check(PyDict_GetItemString(request, "body")));
}

TEST_F(ParamBinderTest, InvalidJsonBody) {
  const HandlerEntry& entry = add("create", "/items", http::Method::POST);
  RequestContext ctx(http::Method::POST, "/items");
  ctx.setBody("{not json");

  const BindResult result = bind(entry, ctx);
  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(result.errors[0].source, "body");
  EXPECT_TRUE(result.errors[0].name.empty());
  EXPECT_EQ(result.errors[0].type, "json_invalid");
  EXPECT_TRUE(result.errors[0].msg.starts_with("JSON decode error: "));
  EXPECT_TRUE(FieldErrorsToJson(result.errors).starts_with(R"([{"loc": ["body"], "msg": "JSON decode error: )"));
}

TEST_F(ParamBinderTest, NonObjectJsonBody) {
  const HandlerEntry& entry = add("create", "/items", http::Method::POST);
  RequestContext ctx(http::Method::POST, "/items");
  ctx.setBody("[1, 2]");

  const BindResult result = bind(entry, ctx);
  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(result.errors[0].type, "dict_type");
}

TEST_F(ParamBinderTest, EmptyBody) {
  {
    const HandlerEntry& entry = add("create", "/items", http::Method::POST);
    const BindResult result = bind(entry, RequestContext(http::Method::POST, "/items"));
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0].source, "body");
    EXPECT_EQ(result.errors[0].type, "missing");
  }
  {
    const HandlerEntry& entry = add("optional_body", "/opt", http::Method::POST);
    const BindResult result = bind(entry, RequestContext(http::Method::POST, "/opt"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(reprOf(result, "payload"), "None");
  }
}

TEST_F(ParamBinderTest, RawBody) {
  const HandlerEntry& entry = add("raw", "/upload", http::Method::PUT);
  RequestContext ctx(http::Method::PUT, "/upload");
  ctx.setBody("abc");

  const BindResult result = bind(entry, ctx);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(reprOf(result, "data"), "b'abc'");
}

}  // namespace turbo

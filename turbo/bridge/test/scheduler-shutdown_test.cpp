#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <utility>

#include "turbo/execution-lock.hpp"
#include "turbo/pending-execution.hpp"
#include "turbo/pending-state.hpp"
#include "turbo/py-ref.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-test-env.hpp"
#include "turbo/request-task.hpp"
#include "turbo/resume-queue.hpp"
#include "turbo/scheduler.hpp"

namespace turbo {

namespace {

using namespace std::chrono_literals;

const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);

constexpr const char* kCoroutines = R"py(
import asyncio

cleaned_up = []

async def slow():
    try:
        await asyncio.sleep(3600)
    finally:
        cleaned_up.append(True)

async def quick():
    return 1
)py";

RequestTask<ExecutionResult> Await(PyRef coroutine, ResumeQueue& queue, uint64_t tag) {
  co_return co_await Scheduler::Instance().submit(std::move(coroutine), ResumeTarget{&queue, tag});
}

PyRef Call(const PyRef& globals, const char* name) {
  PyRef fn = test::GetGlobal(globals, name);
  ExecutionLock lock;
  return PyRef::Steal(PyObject_CallNoArgs(fn.get()));
}

}  // namespace

TEST(SchedulerShutdownTest, ShutdownCancelsPendingAndRefusesNewWork) {
  PyRef globals = test::RunPython(kCoroutines);
  ResumeQueue queue;

  RequestTask<ExecutionResult> slowTask = Await(Call(globals, "slow"), queue, 1);
  slowTask.resume();
  ASSERT_FALSE(slowTask.done());
  Scheduler& scheduler = Scheduler::Instance();
  EXPECT_TRUE(scheduler.available());

  Scheduler::Shutdown();
  EXPECT_EQ(scheduler.state(), Scheduler::State::Stopped);
  // idempotent
  Scheduler::Shutdown();

  const auto limit = std::chrono::steady_clock::now() + 5s;
  while (!slowTask.done() && std::chrono::steady_clock::now() < limit) {
    static_cast<void>(queue.wait(5ms));
    queue.drain([](uint64_t) {});
    queue.expire(std::chrono::steady_clock::now(), [](uint64_t) {});
  }
  ASSERT_TRUE(slowTask.done());
  EXPECT_EQ(slowTask.result().status, ExecutionResult::Status::Unavailable);

  PyRef cleanedUp = test::GetGlobal(globals, "cleaned_up");
  {
    ExecutionLock lock;
    EXPECT_EQ(PyList_GET_SIZE(cleanedUp.get()), 1);
  }

  RequestTask<ExecutionResult> lateTask = Await(Call(globals, "quick"), queue, 2);
  lateTask.resume();
  ASSERT_TRUE(lateTask.done());
  EXPECT_EQ(lateTask.result().status, ExecutionResult::Status::Unavailable);
  EXPECT_EQ(Scheduler::CreatedCount(), 1U);
}

}  // namespace turbo

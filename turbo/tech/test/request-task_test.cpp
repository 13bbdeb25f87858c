#include "turbo/request-task.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <coroutine>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace turbo {

namespace {

struct Guard {
  explicit Guard(std::shared_ptr<std::atomic<int>> value) : alive(std::move(value)) {}
  Guard(const Guard&) = delete;
  Guard& operator=(const Guard&) = delete;
  ~Guard() { alive->store(0, std::memory_order_relaxed); }

  std::shared_ptr<std::atomic<int>> alive;
};

RequestTask<int> GuardedInt(std::shared_ptr<std::atomic<int>> alive) {
  Guard guard(std::move(alive));
  co_await std::suspend_always{};
  co_return 42;
}

RequestTask<std::string> Immediate() { co_return "done"; }

RequestTask<int> Throwing() {
  co_await std::suspend_always{};
  throw std::runtime_error("boom");
}

}  // namespace

TEST(RequestTask, DoesNotRunBeforeFirstResume) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = GuardedInt(alive);
  EXPECT_TRUE(task.valid());
  EXPECT_FALSE(task.done());
  EXPECT_THROW(static_cast<void>(task.result()), std::logic_error);
}

TEST(RequestTask, ResetDestroysSuspendedFrame) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = GuardedInt(alive);
  task.resume();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 1);
  EXPECT_FALSE(task.done());
  task.reset();
  EXPECT_EQ(alive->load(std::memory_order_relaxed), 0);
  EXPECT_FALSE(task.valid());
  EXPECT_TRUE(task.done());
}

TEST(RequestTask, ResumedToCompletionGivesValue) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = GuardedInt(alive);
  task.resume();
  task.resume();
  ASSERT_TRUE(task.done());
  EXPECT_EQ(task.result(), 42);
  // resuming a finished task is a no-op
  task.resume();
}

TEST(RequestTask, CompletesOnFirstResumeWithoutSuspension) {
  auto task = Immediate();
  task.resume();
  ASSERT_TRUE(task.done());
  EXPECT_EQ(task.result(), "done");
}

TEST(RequestTask, ExceptionIsRethrownByResult) {
  auto task = Throwing();
  task.resume();
  task.resume();
  ASSERT_TRUE(task.done());
  EXPECT_THROW(static_cast<void>(task.result()), std::runtime_error);
}

TEST(RequestTask, MoveTransfersOwnership) {
  auto alive = std::make_shared<std::atomic<int>>(1);
  auto task = GuardedInt(alive);
  task.resume();
  RequestTask<int> moved(std::move(task));
  EXPECT_FALSE(task.valid());  // NOLINT(bugprone-use-after-move)
  EXPECT_TRUE(moved.valid());
  moved.resume();
  EXPECT_EQ(moved.result(), 42);
  RequestTask<int> assigned;
  assigned = std::move(moved);
  EXPECT_TRUE(assigned.done());
}

}  // namespace turbo

#include "turbo/execution-lock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "turbo/py-ref.hpp"
#include "turbo/python-include.hpp"
#include "turbo/python-test-env.hpp"

namespace turbo {

namespace {
const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new test::PythonTestEnvironment);
}  // namespace

TEST(ExecutionLockTest, NotHeldOutsideOfScope) {
  EXPECT_FALSE(ExecutionLock::HeldByThisThread());
  {
    ExecutionLock lock;
    EXPECT_TRUE(ExecutionLock::HeldByThisThread());
  }
  EXPECT_FALSE(ExecutionLock::HeldByThisThread());
}

TEST(ExecutionLockTest, IsReentrant) {
  ExecutionLock outer;
  {
    ExecutionLock inner;
    EXPECT_TRUE(ExecutionLock::HeldByThisThread());
  }
  EXPECT_TRUE(ExecutionLock::HeldByThisThread());
}

TEST(ExecutionLockTest, UnlockReleasesTemporarily) {
  ExecutionLock lock;
  {
    ExecutionUnlock unlock;
    EXPECT_FALSE(ExecutionLock::HeldByThisThread());
  }
  EXPECT_TRUE(ExecutionLock::HeldByThisThread());
}

TEST(ExecutionLockTest, SerializesInterpreterAccessAcrossThreads) {
  PyRef counter;
  {
    ExecutionLock lock;
    counter = PyRef::Steal(PyList_New(0));
  }
  static constexpr int kNbThreads = 4;
  static constexpr int kNbAppends = 500;
  std::vector<std::jthread> threads;
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&counter] {
      for (int appendPos = 0; appendPos < kNbAppends; ++appendPos) {
        ExecutionLock lock;
        PyRef item = PyRef::Steal(PyLong_FromLong(appendPos));
        ASSERT_EQ(PyList_Append(counter.get(), item.get()), 0);
      }
    });
  }
  threads.clear();
  ExecutionLock lock;
  EXPECT_EQ(PyList_GET_SIZE(counter.get()), kNbThreads * kNbAppends);
}

TEST(PyRefTest, StealBorrowAndRelease) {
  ExecutionLock lock;
  PyRef list = PyRef::Steal(PyList_New(0));
  ASSERT_TRUE(list);
  const Py_ssize_t initialRefCnt = Py_REFCNT(list.get());
  {
    PyRef borrowed = PyRef::Borrow(list.get());
    EXPECT_EQ(Py_REFCNT(list.get()), initialRefCnt + 1);
    PyRef dup = borrowed.dup();
    EXPECT_EQ(Py_REFCNT(list.get()), initialRefCnt + 2);
  }
  EXPECT_EQ(Py_REFCNT(list.get()), initialRefCnt);

  PyRef moved(std::move(list));
  EXPECT_FALSE(list);  // NOLINT(bugprone-use-after-move)
  PyObject* raw = moved.release();
  EXPECT_FALSE(moved);
  Py_DECREF(raw);
}

TEST(PyRefTest, ResetWithoutLockTakesIt) {
  PyRef obj;
  {
    ExecutionLock lock;
    obj = PyRef::Steal(PyUnicode_FromString("value"));
  }
  ASSERT_FALSE(ExecutionLock::HeldByThisThread());
  obj.reset();
  EXPECT_FALSE(obj);
  EXPECT_FALSE(ExecutionLock::HeldByThisThread());
}

}  // namespace turbo

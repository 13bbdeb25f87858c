#pragma once

#include <gtest/gtest.h>

#include <memory>
#include <string_view>

#include "turbo/py-ref.hpp"
#include "turbo/python-runtime.hpp"

namespace turbo::test {

// GoogleTest global environment owning the embedded interpreter of the test binary.
// The interpreter is initialized once before the first test, with the execution lock released, and finalized
// after the last one.
//
// Usage, at namespace scope of the test file:
//   const auto* const gPythonEnv = ::testing::AddGlobalTestEnvironment(new turbo::test::PythonTestEnvironment);
class PythonTestEnvironment : public ::testing::Environment {
 public:
  void SetUp() override;

  void TearDown() override;

  // Throws std::logic_error if the environment is not set up.
  static PythonRuntime& Runtime();

 private:
  std::unique_ptr<PythonRuntime> _runtime;
};

// Executes 'code' in a fresh namespace and returns it. Takes the execution lock.
PyRef RunPython(std::string_view code);

// Returns the value bound to 'name' in the namespace returned by RunPython. Takes the execution lock.
// Throws std::invalid_argument if not found.
PyRef GetGlobal(const PyRef& globals, const char* name);

// Drops the handlers and settings registered through the turbo module. Takes the execution lock.
void ResetTurboModule();

}  // namespace turbo::test

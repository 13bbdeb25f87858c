#include "turbo/py-ref.hpp"

#include "turbo/execution-lock.hpp"
#include "turbo/python-include.hpp"

namespace turbo {

void PyRef::reset() noexcept {
  if (_obj == nullptr) {
    return;
  }
  if (Py_IsInitialized() != 0) {
    ExecutionLock lock;
    Py_DECREF(_obj);
  }
  _obj = nullptr;
}

}  // namespace turbo

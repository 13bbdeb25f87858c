#pragma once

#include "turbo/python-include.hpp"

#include <utility>

namespace turbo {

// Owning reference to a Python object.
// Creating a reference from a borrowed pointer requires the execution lock. Releasing it does not: the
// lock is taken if needed, and the reference is leaked if the interpreter is already finalized.
class PyRef {
 public:
  PyRef() noexcept = default;

  // Takes ownership of a new reference (nullptr allowed).
  [[nodiscard]] static PyRef Steal(PyObject* obj) noexcept { return PyRef(obj); }

  // Creates a new reference from a borrowed one. Requires the execution lock.
  [[nodiscard]] static PyRef Borrow(PyObject* obj) noexcept {
    Py_XINCREF(obj);
    return PyRef(obj);
  }

  PyRef(const PyRef&) = delete;
  PyRef& operator=(const PyRef&) = delete;

  PyRef(PyRef&& other) noexcept : _obj(std::exchange(other._obj, nullptr)) {}

  PyRef& operator=(PyRef&& other) noexcept {
    if (this != &other) {
      reset();
      _obj = std::exchange(other._obj, nullptr);
    }
    return *this;
  }

  ~PyRef() { reset(); }

  [[nodiscard]] PyObject* get() const noexcept { return _obj; }

  // Gives up ownership, the caller becomes responsible for the reference.
  [[nodiscard]] PyObject* release() noexcept { return std::exchange(_obj, nullptr); }

  // Returns a new reference to the same object. Requires the execution lock.
  [[nodiscard]] PyRef dup() const noexcept { return Borrow(_obj); }

  explicit operator bool() const noexcept { return _obj != nullptr; }

  void reset() noexcept;

 private:
  explicit PyRef(PyObject* obj) noexcept : _obj(obj) {}

  PyObject* _obj{};
};

}  // namespace turbo

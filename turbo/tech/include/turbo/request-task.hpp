#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace turbo {

// Lazily started coroutine producing a single value of type T.
//
// The coroutine does not run until the first resume(). Whoever owns the task resumes it once to start it; from
// then on it is resumed by the awaitables it suspends on. An exception escaping the coroutine body is stored and
// rethrown by result().
template <class T>
class RequestTask {
 public:
  struct promise_type {
    RequestTask get_return_object() noexcept {
      return RequestTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept(std::is_nothrow_move_constructible_v<T>) { _value.emplace(std::move(value)); }

    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    T&& consume_result() {
      if (_exception) {
        std::rethrow_exception(_exception);
      }
      if (!_value) {
        throw std::logic_error("RequestTask has no result");
      }
      return std::move(*_value);
    }

    std::exception_ptr _exception;
    std::optional<T> _value;
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  void resume() {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
  }

  // Result of a finished task. Rethrows the exception that escaped the coroutine, if any.
  T result() {
    if (!_coro || !_coro.done()) {
      throw std::logic_error("RequestTask is not finished");
    }
    return std::move(_coro.promise().consume_result());
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace turbo

#pragma once

#include "turbo/python-include.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

#include "turbo/handler-entry.hpp"
#include "turbo/http-method.hpp"
#include "turbo/router.hpp"

namespace turbo {

// Table of Python handlers, built at startup and read-only once frozen.
// Entries are indexed by the RouteId assigned by the router.
class HandlerRegistry {
 public:
  HandlerRegistry() = default;

  HandlerRegistry(const HandlerRegistry&) = delete;
  HandlerRegistry(HandlerRegistry&&) = delete;
  HandlerRegistry& operator=(const HandlerRegistry&) = delete;
  HandlerRegistry& operator=(HandlerRegistry&&) = delete;

  ~HandlerRegistry() = default;

  // Registers 'callable' for (method, pathPattern). Requires the execution lock.
  // The handler is introspected once: coroutine function or not, parameters and their annotations.
  // Registering the same (method, pattern) twice keeps the first handler and returns it.
  // Throws std::invalid_argument for invalid patterns or handlers, std::logic_error once frozen and
  // PythonException if introspection fails.
  const HandlerEntry& add(http::Method method, std::string_view pathPattern, PyObject* callable);

  // Forbids further registrations.
  void freeze() noexcept { _frozen = true; }

  [[nodiscard]] bool frozen() const noexcept { return _frozen; }

  [[nodiscard]] const Router& router() const noexcept { return _router; }

  [[nodiscard]] const HandlerEntry& entry(RouteId routeId) const { return _entries[routeId]; }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] std::size_t nbAsync() const noexcept { return _nbAsync; }

  // One line per route: "GET /items/{id} -> get_item (sync)".
  [[nodiscard]] std::string describe() const;

  // Drops every handler, and unfreezes the registry.
  void clear();

 private:
  Router _router;
  std::deque<HandlerEntry> _entries;
  std::size_t _nbAsync{};
  bool _frozen{false};
};

}  // namespace turbo

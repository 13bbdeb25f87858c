#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "turbo/http-method.hpp"
#include "turbo/path-param-capture.hpp"

namespace turbo {

using RouteId = uint32_t;

inline constexpr RouteId kInvalidRouteId = std::numeric_limits<RouteId>::max();

// Path pattern trie mapping (method, path) to the RouteId of the registered handler.
//
// Pattern syntax:
//   - literal segments:        /users/me
//   - parameter segments:      /users/{id}     (whole segment, non-empty, name is a Python identifier)
//   - terminal wildcard:       /static/*       (matches one or more remaining segments, no capture)
// Trailing slashes are significant: "/a" and "/a/" are different routes.
//
// Precedence at every depth: literal segment, then parameter segment, then wildcard. Matching backtracks, so a
// literal prefix that does not lead to a route for the request method does not hide a parametric one.
//
// Registration is not thread safe. Once built, 'match' is const and can be called concurrently with
// caller-owned MatchBuffer objects.
class Router {
 public:
  struct AddResult {
    RouteId routeId;
    // false if (method, pattern) was already registered, in which case routeId refers to the first one.
    bool inserted;
  };

  // Reusable per-thread scratch space for 'match'. Captures returned by 'match' point into it.
  class MatchBuffer {
   private:
    friend class Router;

    std::vector<std::string_view> _segments;
    std::vector<std::string_view> _paramValues;
    std::vector<PathParamCapture> _captures;
  };

  struct MatchResult {
    enum class Status : uint8_t { Found, NotFound, MethodNotAllowed };

    Status status{Status::NotFound};
    RouteId routeId{kInvalidRouteId};
    // For MethodNotAllowed, the methods registered for the matching path (HEAD included when GET is).
    http::MethodBmp allowedMethods{};
    std::span<const PathParamCapture> pathParams;
  };

  // Registers 'pattern' for 'method'. Throws std::invalid_argument on malformed patterns.
  AddResult add(http::Method method, std::string_view pattern);

  [[nodiscard]] MatchResult match(http::Method method, std::string_view path, MatchBuffer& buffer) const;

  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _routes.size(); }

  [[nodiscard]] std::string_view pattern(RouteId routeId) const { return _routes[routeId].pattern; }

  [[nodiscard]] http::Method method(RouteId routeId) const { return _routes[routeId].method; }

  // Names of the parameters of the route, in path order.
  [[nodiscard]] std::span<const std::string> paramNames(RouteId routeId) const {
    return _routes[routeId].paramNames;
  }

 private:
  using NodeIdx = uint32_t;

  static constexpr NodeIdx kNoNode = std::numeric_limits<NodeIdx>::max();

  struct Node {
    Node() noexcept {
      routes.fill(kInvalidRouteId);
      wildcardRoutes.fill(kInvalidRouteId);
    }

    std::vector<std::pair<std::string, NodeIdx>> literals;
    NodeIdx paramChild{kNoNode};
    std::array<RouteId, http::kNbMethods> routes;
    std::array<RouteId, http::kNbMethods> wildcardRoutes;
  };

  struct RouteInfo {
    http::Method method;
    std::string pattern;
    std::vector<std::string> paramNames;
  };

  struct MatchState;

  NodeIdx literalChild(NodeIdx nodeIdx, std::string_view segment) const noexcept;

  bool matchNode(MatchState& state, NodeIdx nodeIdx, std::size_t segIdx) const;

  static RouteId SelectRoute(const std::array<RouteId, http::kNbMethods>& routes, http::Method method) noexcept;

  static http::MethodBmp RegisteredMethods(const std::array<RouteId, http::kNbMethods>& routes) noexcept;

  std::vector<Node> _nodes = std::vector<Node>(1);
  std::vector<RouteInfo> _routes;
};

}  // namespace turbo

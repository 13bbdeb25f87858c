#include "turbo/router.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "turbo/http-method.hpp"
#include "turbo/log.hpp"
#include "turbo/path-param-capture.hpp"

namespace turbo {

namespace {

constexpr std::string_view kWildcard = "*";

constexpr bool IsIdentifierStart(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

constexpr bool IsIdentifierChar(char ch) noexcept { return IsIdentifierStart(ch) || (ch >= '0' && ch <= '9'); }

// Splits an absolute path into its segments. "/" has no segment, "/a/" has segments "a" and "".
void SplitSegments(std::string_view path, std::vector<std::string_view>& segments) {
  segments.clear();
  path.remove_prefix(1);
  if (path.empty()) {
    return;
  }
  while (true) {
    const auto slashPos = path.find('/');
    segments.push_back(path.substr(0, slashPos));
    if (slashPos == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slashPos + 1);
  }
}

// Returns the parameter name of a "{name}" segment, an empty view for a literal segment.
// Throws std::invalid_argument for malformed parameter segments.
std::string_view ParseParamSegment(std::string_view pattern, std::string_view segment) {
  const bool hasBrace = segment.find_first_of("{}") != std::string_view::npos;
  if (!hasBrace) {
    return {};
  }
  if (segment.size() < 2U || segment.front() != '{' || segment.back() != '}') {
    throw std::invalid_argument(
        fmt::format("Invalid segment '{}' in pattern '{}': parameters must span a whole segment", segment, pattern));
  }
  const std::string_view name = segment.substr(1, segment.size() - 2U);
  if (name.empty()) {
    throw std::invalid_argument(fmt::format("Empty parameter name in pattern '{}'", pattern));
  }
  if (!IsIdentifierStart(name.front()) || !std::ranges::all_of(name, IsIdentifierChar)) {
    throw std::invalid_argument(fmt::format("Invalid parameter name '{}' in pattern '{}'", name, pattern));
  }
  return name;
}

}  // namespace

struct Router::MatchState {
  http::Method method;
  const std::vector<std::string_view>& segments;
  std::vector<std::string_view>& paramValues;
  RouteId routeId{kInvalidRouteId};
  http::MethodBmp allowedMethods{};
};

Router::AddResult Router::add(http::Method method, std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument(fmt::format("Route pattern '{}' must start with '/'", pattern));
  }

  std::vector<std::string_view> segments;
  SplitSegments(pattern, segments);

  std::vector<std::string> paramNames;
  bool wildcard = false;
  NodeIdx nodeIdx = 0;
  for (std::size_t segIdx = 0; segIdx < segments.size(); ++segIdx) {
    const std::string_view segment = segments[segIdx];
    if (segment == kWildcard) {
      if (segIdx + 1U != segments.size()) {
        throw std::invalid_argument(fmt::format("Wildcard must be the last segment of pattern '{}'", pattern));
      }
      wildcard = true;
      break;
    }
    const std::string_view paramName = ParseParamSegment(pattern, segment);
    if (!paramName.empty()) {
      if (std::ranges::find(paramNames, paramName) != paramNames.end()) {
        throw std::invalid_argument(fmt::format("Duplicate parameter name '{}' in pattern '{}'", paramName, pattern));
      }
      paramNames.emplace_back(paramName);
      NodeIdx childIdx = _nodes[nodeIdx].paramChild;
      if (childIdx == kNoNode) {
        childIdx = static_cast<NodeIdx>(_nodes.size());
        _nodes.emplace_back();
        _nodes[nodeIdx].paramChild = childIdx;
      }
      nodeIdx = childIdx;
    } else {
      NodeIdx childIdx = literalChild(nodeIdx, segment);
      if (childIdx == kNoNode) {
        childIdx = static_cast<NodeIdx>(_nodes.size());
        _nodes.emplace_back();
        _nodes[nodeIdx].literals.emplace_back(segment, childIdx);
      }
      nodeIdx = childIdx;
    }
  }

  Node& node = _nodes[nodeIdx];
  RouteId& slot = wildcard ? node.wildcardRoutes[http::MethodToIdx(method)] : node.routes[http::MethodToIdx(method)];
  if (slot != kInvalidRouteId) {
    return {slot, false};
  }
  slot = static_cast<RouteId>(_routes.size());
  _routes.emplace_back(method, std::string(pattern), std::move(paramNames));
  log::debug("Registered route {} {} with id {}", http::MethodToStr(method), pattern, slot);
  return {slot, true};
}

Router::NodeIdx Router::literalChild(NodeIdx nodeIdx, std::string_view segment) const noexcept {
  for (const auto& [literal, childIdx] : _nodes[nodeIdx].literals) {
    if (literal == segment) {
      return childIdx;
    }
  }
  return kNoNode;
}

RouteId Router::SelectRoute(const std::array<RouteId, http::kNbMethods>& routes, http::Method method) noexcept {
  RouteId routeId = routes[http::MethodToIdx(method)];
  if (routeId == kInvalidRouteId && method == http::Method::HEAD) {
    routeId = routes[http::MethodToIdx(http::Method::GET)];
  }
  return routeId;
}

http::MethodBmp Router::RegisteredMethods(const std::array<RouteId, http::kNbMethods>& routes) noexcept {
  http::MethodBmp methods{};
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (routes[methodIdx] != kInvalidRouteId) {
      methods = methods | http::MethodFromIdx(methodIdx);
    }
  }
  if (http::IsMethodSet(methods, http::Method::GET)) {
    methods = methods | http::Method::HEAD;
  }
  return methods;
}

bool Router::matchNode(MatchState& state, NodeIdx nodeIdx, std::size_t segIdx) const {
  const Node& node = _nodes[nodeIdx];
  if (segIdx == state.segments.size()) {
    state.routeId = SelectRoute(node.routes, state.method);
    if (state.routeId != kInvalidRouteId) {
      return true;
    }
    state.allowedMethods |= RegisteredMethods(node.routes);
    return false;
  }

  const std::string_view segment = state.segments[segIdx];

  const NodeIdx literalIdx = literalChild(nodeIdx, segment);
  if (literalIdx != kNoNode && matchNode(state, literalIdx, segIdx + 1U)) {
    return true;
  }

  if (node.paramChild != kNoNode && !segment.empty()) {
    state.paramValues.push_back(segment);
    if (matchNode(state, node.paramChild, segIdx + 1U)) {
      return true;
    }
    state.paramValues.pop_back();
  }

  state.routeId = SelectRoute(node.wildcardRoutes, state.method);
  if (state.routeId != kInvalidRouteId) {
    return true;
  }
  state.allowedMethods |= RegisteredMethods(node.wildcardRoutes);
  return false;
}

Router::MatchResult Router::match(http::Method method, std::string_view path, MatchBuffer& buffer) const {
  MatchResult result;
  if (path.empty() || path.front() != '/') {
    return result;
  }

  SplitSegments(path, buffer._segments);
  buffer._paramValues.clear();
  buffer._captures.clear();

  MatchState state{method, buffer._segments, buffer._paramValues};
  if (matchNode(state, 0, 0)) {
    const RouteInfo& route = _routes[state.routeId];
    for (std::size_t paramPos = 0; paramPos < route.paramNames.size(); ++paramPos) {
      buffer._captures.emplace_back(route.paramNames[paramPos], buffer._paramValues[paramPos]);
    }
    result.status = MatchResult::Status::Found;
    result.routeId = state.routeId;
    result.pathParams = buffer._captures;
  } else if (state.allowedMethods != 0) {
    result.status = MatchResult::Status::MethodNotAllowed;
    result.allowedMethods = state.allowedMethods;
  }
  return result;
}

}  // namespace turbo

#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/gateway/http.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gatewayd::gateway {

struct RpcContext {
  std::string auth_token;
  std::optional<std::string> request_id;
  std::optional<std::string> session_id;
};

/// Receives `params` as JSON object text, returns the result as JSON text.
/// Throwing reports a handler error to the caller.
using RpcHandlerFn = std::function<std::string(const std::string &params_json,
                                               const RpcContext &context)>;

struct RpcMethod {
  std::string id;
  std::string plugin_id;
  std::string description;
  RpcHandlerFn handler;
};

class MethodRegistry {
public:
  /// Validation error for an empty id, a missing handler or a duplicate id.
  [[nodiscard]] common::Status register_method(RpcMethod method);
  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] std::vector<RpcMethod> list() const;

  /// MethodNotFound for unknown ids; HandlerError when the handler throws.
  [[nodiscard]] common::Result<std::string> invoke(const std::string &id,
                                                   const std::string &params_json,
                                                   const RpcContext &context) const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, RpcMethod> methods_;
};

using RouteHandlerFn = std::function<HttpResponse(const HttpRequest &)>;

struct HttpRoute {
  std::string method;
  std::string path;
  RouteHandlerFn handler;
};

class RouteRegistry {
public:
  /// Validation error for a duplicate method+path pair.
  [[nodiscard]] common::Status register_route(HttpRoute route);
  [[nodiscard]] std::optional<RouteHandlerFn> find(const std::string &method,
                                                   const std::string &path) const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, RouteHandlerFn> routes_;
};

} // namespace gatewayd::gateway

#include "gatewayd/gateway/registry.hpp"

#include "gatewayd/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace gatewayd::gateway {

namespace {

std::string upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

} // namespace

common::Status MethodRegistry::register_method(RpcMethod method) {
  method.id = common::trim(method.id);
  if (method.id.empty()) {
    return common::Status::error(common::ErrorCode::Validation, "method id is required");
  }
  if (!method.handler) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "method " + method.id + " has no handler");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (methods_.contains(method.id)) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "method already registered: " + method.id);
  }
  const std::string id = method.id;
  methods_.emplace(id, std::move(method));
  return common::Status::success();
}

bool MethodRegistry::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return methods_.contains(id);
}

std::vector<RpcMethod> MethodRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RpcMethod> out;
  out.reserve(methods_.size());
  for (const auto &[id, method] : methods_) {
    (void)id;
    out.push_back(method);
  }
  return out;
}

common::Result<std::string> MethodRegistry::invoke(const std::string &id,
                                                   const std::string &params_json,
                                                   const RpcContext &context) const {
  RpcHandlerFn handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = methods_.find(id);
    if (it == methods_.end()) {
      return common::Result<std::string>::failure(common::ErrorCode::MethodNotFound,
                                                  "Unknown method: " + id);
    }
    handler = it->second.handler;
  }

  try {
    return common::Result<std::string>::success(handler(params_json, context));
  } catch (const std::exception &e) {
    return common::Result<std::string>::failure(common::ErrorCode::HandlerError, e.what());
  }
}

common::Status RouteRegistry::register_route(HttpRoute route) {
  route.method = upper(common::trim(route.method));
  route.path = common::trim(route.path);
  if (route.method.empty() || route.path.empty() || route.path.front() != '/') {
    return common::Status::error(common::ErrorCode::Validation,
                                 "route needs a method and an absolute path");
  }
  if (!route.handler) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "route " + route.method + " " + route.path + " has no handler");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto key = std::make_pair(route.method, route.path);
  if (routes_.contains(key)) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "route already registered: " + route.method + " " + route.path);
  }
  routes_.emplace(std::move(key), std::move(route.handler));
  return common::Status::success();
}

std::optional<RouteHandlerFn> RouteRegistry::find(const std::string &method,
                                                  const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = routes_.find(std::make_pair(upper(method), path));
  if (it == routes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t RouteRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return routes_.size();
}

} // namespace gatewayd::gateway

#include "gatewayd/health/health.hpp"

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/common/time.hpp"

#include <mutex>
#include <sstream>

namespace gatewayd::health {

namespace {

std::mutex g_mutex;
std::map<std::string, ComponentStatus> g_components;

template <typename Fn> void update(const std::string &name, Fn &&fn) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto &component = g_components[name];
  component.updated_at = common::now_rfc3339();
  fn(component);
}

void write_optional(std::ostringstream &json, const char *key,
                    const std::optional<std::string> &value) {
  if (value.has_value()) {
    json << ",\"" << key << "\":" << common::json_quote(*value);
  }
}

} // namespace

std::string_view component_state_name(const ComponentState state) {
  switch (state) {
  case ComponentState::Unknown:
    return "unknown";
  case ComponentState::Starting:
    return "starting";
  case ComponentState::Ok:
    return "ok";
  case ComponentState::Error:
    return "error";
  case ComponentState::Stopped:
    return "stopped";
  }
  return "unknown";
}

void mark_component_starting(const std::string &name) {
  update(name, [](ComponentStatus &component) {
    component.state = ComponentState::Starting;
    component.last_error.reset();
  });
}

void mark_component_ok(const std::string &name) {
  update(name, [](ComponentStatus &component) {
    component.state = ComponentState::Ok;
    component.last_ok = component.updated_at;
    component.last_error.reset();
  });
}

void mark_component_error(const std::string &name, const std::string &error) {
  update(name, [&error](ComponentStatus &component) {
    component.state = ComponentState::Error;
    component.last_error = error;
    ++component.error_count;
  });
}

void mark_component_stopped(const std::string &name) {
  update(name, [](ComponentStatus &component) { component.state = ComponentState::Stopped; });
}

void bump_component_restart(const std::string &name) {
  update(name, [](ComponentStatus &component) { ++component.restart_count; });
}

std::optional<ComponentStatus> get_component(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto it = g_components.find(name);
  if (it == g_components.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, ComponentStatus> components() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_components;
}

std::vector<std::string> degraded_components() {
  std::vector<std::string> names;
  for (const auto &[name, component] : components()) {
    if (component.state == ComponentState::Error) {
      names.push_back(name);
    }
  }
  return names;
}

std::string components_json() {
  std::ostringstream json;
  json << "{";
  bool first = true;
  for (const auto &[name, component] : components()) {
    json << (first ? "" : ",") << common::json_quote(name) << ":{\"state\":"
         << common::json_quote(std::string(component_state_name(component.state)))
         << ",\"restartCount\":" << component.restart_count
         << ",\"errorCount\":" << component.error_count
         << ",\"updatedAt\":" << common::json_quote(component.updated_at);
    write_optional(json, "lastOk", component.last_ok);
    write_optional(json, "lastError", component.last_error);
    json << "}";
    first = false;
  }
  json << "}";
  return json.str();
}

void clear() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_components.clear();
}

} // namespace gatewayd::health

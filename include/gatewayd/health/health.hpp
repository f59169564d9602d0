#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gatewayd::health {

enum class ComponentState {
  Unknown,
  Starting,
  Ok,
  Error,
  Stopped,
};

[[nodiscard]] std::string_view component_state_name(ComponentState state);

/// Process-wide status of one named part of the daemon ("gateway",
/// "credentials"). Timestamps are RFC 3339.
struct ComponentStatus {
  ComponentState state = ComponentState::Unknown;
  std::size_t restart_count = 0;
  std::size_t error_count = 0;
  std::optional<std::string> last_error;
  std::string updated_at;
  std::optional<std::string> last_ok;
};

void mark_component_starting(const std::string &name);
void mark_component_ok(const std::string &name);
void mark_component_error(const std::string &name, const std::string &error);
void mark_component_stopped(const std::string &name);
void bump_component_restart(const std::string &name);

[[nodiscard]] std::optional<ComponentStatus> get_component(const std::string &name);
[[nodiscard]] std::map<std::string, ComponentStatus> components();
/// Names of components currently in the Error state, sorted.
[[nodiscard]] std::vector<std::string> degraded_components();
/// `{"gateway":{"state":"ok","restartCount":0,...},...}` sorted by name.
[[nodiscard]] std::string components_json();
void clear();

} // namespace gatewayd::health

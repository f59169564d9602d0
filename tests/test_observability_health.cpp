#include "test_framework.hpp"

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/health/health.hpp"
#include "gatewayd/observability/factory.hpp"
#include "gatewayd/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

void register_observability_health_tests(std::vector<gatewayd::tests::TestCase> &tests) {
  using gatewayd::tests::require;
  namespace obs = gatewayd::observability;
  namespace health = gatewayd::health;

  tests.push_back({"observer_factory_selects_backend", [] {
                     require(obs::create_observer("log")->name() == "log", "log backend");
                     require(obs::create_observer("none")->name() == "none", "none backend");
                     require(obs::create_observer(" NOOP ")->name() == "none",
                             "name is trimmed and lowercased");
                     require(obs::create_observer("unknown")->name() == "log",
                             "unknown falls back to log");
                   }});

  tests.push_back({"log_observer_filters_below_threshold", [] {
                     std::ostringstream sink;
                     obs::LogObserver observer(obs::LogLevel::Warn, sink);
                     observer.record_event(obs::LifecycleEvent{
                         .component = "daemon", .action = "started", .detail = ""});
                     observer.record_event(obs::AuthEvent{.method = "token", .success = false});
                     observer.record_event(
                         obs::ErrorEvent{.component = "gateway", .message = "bind failed"});
                     observer.record_metric(obs::ActiveConnectionsMetric{.count = 2});

                     const std::string out = sink.str();
                     require(out.find("daemon.started") == std::string::npos,
                             "info suppressed at warn");
                     require(out.find("[WARN] auth method=token success=false") !=
                                 std::string::npos,
                             "failed auth logged: " + out);
                     require(out.find("[ERROR] gateway: bind failed") != std::string::npos,
                             "error logged");
                     require(out.find("active_connections") == std::string::npos,
                             "debug metric suppressed");
                   }});

  tests.push_back({"log_level_names_parse", [] {
                     require(obs::parse_log_level(" WARNING ") == obs::LogLevel::Warn, "warning");
                     require(obs::parse_log_level("debug") == obs::LogLevel::Debug, "debug");
                     require(!obs::parse_log_level("loud").has_value(), "unknown rejected");
                     require(obs::log_level_name(obs::LogLevel::Error) == "error", "name");
                   }});

  tests.push_back({"global_observer_receives_typed_events", [] {
                     auto recorder = std::make_unique<gatewayd::testing::RecordingObserver>();
                     auto *raw = recorder.get();
                     obs::set_global_observer(std::move(recorder));

                     obs::record_auth("pair", true, std::string("client_1"));
                     obs::record_webhook("deploy", 2);
                     obs::record_metric(obs::BroadcastDeliveryMetric{
                         .event_type = "tick", .delivered = 3, .failed = 1});

                     const auto events = raw->events();
                     require(events.size() == 2, "two events");
                     const auto *auth = std::get_if<obs::AuthEvent>(&events[0]);
                     require(auth != nullptr && auth->success && auth->method == "pair",
                             "auth event first");
                     require(auth->client_id.value_or("") == "client_1", "client id carried");
                     const auto *hook = std::get_if<obs::WebhookEvent>(&events[1]);
                     require(hook != nullptr && hook->matched_jobs == 2, "webhook event");

                     const auto metrics = raw->metrics();
                     require(metrics.size() == 1, "one metric");
                     const auto *delivery = std::get_if<obs::BroadcastDeliveryMetric>(&metrics[0]);
                     require(delivery != nullptr && delivery->delivered == 3, "delivery metric");

                     obs::set_global_observer(nullptr);
                     obs::record_error("test", "dropped without an observer");
                   }});

  tests.push_back({"health_tracks_component_transitions", [] {
                     health::clear();
                     health::mark_component_starting("gateway");
                     require(health::get_component("gateway")->state == health::ComponentState::Starting,
                             "starting");
                     health::mark_component_error("gateway", "bind failed");
                     auto component = health::get_component("gateway");
                     require(component->state == health::ComponentState::Error, "error");
                     require(component->error_count == 1, "error counted");
                     require(health::degraded_components() ==
                                 std::vector<std::string>{"gateway"},
                             "gateway degraded");
                     require(component->last_error.value_or("") == "bind failed", "error kept");
                     health::bump_component_restart("gateway");
                     health::mark_component_ok("gateway");
                     component = health::get_component("gateway");
                     require(component->state == health::ComponentState::Ok, "ok");
                     require(health::degraded_components().empty(), "nothing degraded");
                     require(component->restart_count == 1, "restart counted");
                     require(!component->last_error.has_value(), "error cleared by ok");
                     require(component->last_ok.has_value(), "last_ok stamped");
                     require(!health::get_component("missing").has_value(), "unknown component");
                     health::clear();
                   }});

  tests.push_back({"health_components_json_is_sorted_object", [] {
                     health::clear();
                     health::mark_component_ok("zeta");
                     health::mark_component_stopped("alpha");
                     const auto json = health::components_json();
                     require(gatewayd::common::json_is_object(json), "valid object: " + json);
                     require(json.find("\"alpha\"") < json.find("\"zeta\""), "sorted by name");
                     const auto alpha = gatewayd::common::json_get_object(json, "alpha");
                     require(gatewayd::common::json_get_string(alpha, "state") == "stopped",
                             "alpha state");
                     require(gatewayd::common::json_get_number(alpha, "restartCount") == "0",
                             "restart count");
                     health::clear();
                     require(health::components_json() == "{}", "empty after clear");
                   }});
}

#pragma once

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/common/result.hpp"
#include "gatewayd/security/credentials.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace gatewayd::gateway {

/// One decoded client frame. `fields` holds the top-level members: strings
/// unescaped, objects and arrays as raw JSON text.
struct ClientMessage {
  std::string type;
  common::JsonFlatMap fields;

  /// String member, or "" when absent or null.
  [[nodiscard]] std::string get(const std::string &key) const;
  /// Object member as JSON text, or "{}" when absent or not an object.
  [[nodiscard]] std::string object(const std::string &key) const;
};

/// Validation error for invalid JSON, a non-object frame or a missing type.
[[nodiscard]] common::Result<ClientMessage> parse_client_message(const std::string &text);

struct GatewayEvent {
  std::string type;
  std::string payload_json = "{}";
  std::string at;
};

/// `raw` when it is valid JSON, otherwise `raw` as a JSON string.
[[nodiscard]] std::string as_json_value(const std::string &raw);

[[nodiscard]] std::string hello_message(const std::string &version,
                                        const std::string &server_time);
[[nodiscard]] std::string auth_ok_message(const security::AuthClient &client);
[[nodiscard]] std::string auth_error_message(const std::string &message);
[[nodiscard]] std::string paired_message(const security::IssuedToken &issued);
[[nodiscard]] std::string subscription_message(bool subscribed, const std::string &at);
[[nodiscard]] std::string pong_message(std::int64_t ts);
[[nodiscard]] std::string command_event_message(const std::string &id, const std::string &event,
                                                const std::string &data_json);
/// ok:true with `result` as the JSON payload, or ok:false with the error text.
[[nodiscard]] std::string command_result_message(const std::string &id,
                                                 const common::Result<std::string> &result);
[[nodiscard]] std::string event_message(const GatewayEvent &event);
[[nodiscard]] std::string rpc_error_message(const std::string &error, const std::string &at);
[[nodiscard]] std::string rpc_result_message(const std::optional<std::string> &request_id,
                                             const common::Result<std::string> &result);

struct RpcEnvelope {
  std::string method;
  std::string params_json = "{}";
  std::optional<std::string> request_id;
};

/// `{method, params?, requestId?}`. Validation error when the body is not an
/// object, the method is missing, or params is not an object.
[[nodiscard]] common::Result<RpcEnvelope> parse_rpc_envelope(const std::string &json);

/// `{requestId, ok, result}` or `{requestId, ok:false, error:{code,message}}`.
[[nodiscard]] std::string rpc_response_body(const std::optional<std::string> &request_id,
                                            const common::Result<std::string> &result);

} // namespace gatewayd::gateway

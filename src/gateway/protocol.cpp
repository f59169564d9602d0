#include "gatewayd/gateway/protocol.hpp"

#include "gatewayd/common/fs.hpp"

#include <sstream>

namespace gatewayd::gateway {

namespace {

std::string request_id_json(const std::optional<std::string> &request_id) {
  return request_id.has_value() ? common::json_quote(*request_id) : "null";
}

std::string error_object(const common::ErrorCode code, const std::string &message) {
  return "{\"code\":" + common::json_quote(std::string(common::error_code_name(code))) +
         ",\"message\":" + common::json_quote(message) + "}";
}

std::string flat_string(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return "";
  }
  return it->second;
}

} // namespace

std::string ClientMessage::get(const std::string &key) const { return flat_string(fields, key); }

std::string ClientMessage::object(const std::string &key) const {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty() || it->second.front() != '{') {
    return "{}";
  }
  return it->second;
}

common::Result<ClientMessage> parse_client_message(const std::string &text) {
  if (!common::json_is_valid(text)) {
    return common::Result<ClientMessage>::failure(common::ErrorCode::Validation,
                                                  "Invalid JSON payload");
  }
  if (!common::json_is_object(text)) {
    return common::Result<ClientMessage>::failure(common::ErrorCode::Validation,
                                                  "Invalid message shape");
  }
  ClientMessage message;
  message.fields = common::json_parse_flat(text);
  message.type = common::trim(flat_string(message.fields, "type"));
  if (message.type.empty()) {
    return common::Result<ClientMessage>::failure(common::ErrorCode::Validation,
                                                  "Message type is required");
  }
  return common::Result<ClientMessage>::success(std::move(message));
}

std::string as_json_value(const std::string &raw) {
  if (!raw.empty() && common::json_is_valid(raw)) {
    return common::trim(raw);
  }
  return common::json_quote(raw);
}

std::string hello_message(const std::string &version, const std::string &server_time) {
  return "{\"type\":\"hello\",\"version\":" + common::json_quote(version) +
         ",\"authRequired\":true,\"serverTime\":" + common::json_quote(server_time) + "}";
}

std::string auth_ok_message(const security::AuthClient &client) {
  return "{\"type\":\"auth_ok\",\"clientId\":" + common::json_quote(client.id) +
         ",\"label\":" + common::json_quote(client.label) +
         ",\"tokenIssuedAt\":" + common::json_quote(client.token_issued_at) + "}";
}

std::string auth_error_message(const std::string &message) {
  return "{\"type\":\"auth_error\",\"message\":" + common::json_quote(message) + "}";
}

std::string paired_message(const security::IssuedToken &issued) {
  return "{\"type\":\"paired\",\"token\":" + common::json_quote(issued.token) +
         ",\"clientId\":" + common::json_quote(issued.client.id) +
         ",\"label\":" + common::json_quote(issued.client.label) + "}";
}

std::string subscription_message(const bool subscribed, const std::string &at) {
  return std::string("{\"type\":\"") + (subscribed ? "subscribed" : "unsubscribed") +
         "\",\"ok\":true,\"at\":" + common::json_quote(at) + "}";
}

std::string pong_message(const std::int64_t ts) {
  return "{\"type\":\"pong\",\"ts\":" + std::to_string(ts) + "}";
}

std::string command_event_message(const std::string &id, const std::string &event,
                                  const std::string &data_json) {
  return "{\"type\":\"command_event\",\"id\":" + common::json_quote(id) +
         ",\"event\":" + common::json_quote(event) + ",\"data\":" + as_json_value(data_json) +
         "}";
}

std::string command_result_message(const std::string &id,
                                   const common::Result<std::string> &result) {
  std::ostringstream out;
  out << "{\"type\":\"command_result\",\"id\":" << common::json_quote(id);
  if (result.ok()) {
    out << ",\"ok\":true,\"result\":" << as_json_value(result.value());
  } else {
    out << ",\"ok\":false,\"error\":" << common::json_quote(result.error());
  }
  out << "}";
  return out.str();
}

std::string event_message(const GatewayEvent &event) {
  return "{\"type\":\"event\",\"event\":{\"type\":" + common::json_quote(event.type) +
         ",\"payload\":" + as_json_value(event.payload_json) +
         ",\"at\":" + common::json_quote(event.at) + "}}";
}

std::string rpc_error_message(const std::string &error, const std::string &at) {
  return "{\"type\":\"rpc_error\",\"error\":" + common::json_quote(error) +
         ",\"at\":" + common::json_quote(at) + "}";
}

std::string rpc_result_message(const std::optional<std::string> &request_id,
                               const common::Result<std::string> &result) {
  std::ostringstream out;
  out << "{\"type\":\"rpc_result\",\"requestId\":" << request_id_json(request_id);
  if (result.ok()) {
    out << ",\"ok\":true,\"result\":" << as_json_value(result.value());
  } else {
    out << ",\"ok\":false,\"error\":" << error_object(result.code(), result.error());
  }
  out << "}";
  return out.str();
}

common::Result<RpcEnvelope> parse_rpc_envelope(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<RpcEnvelope>::failure(common::ErrorCode::Validation,
                                                "Request body must be a JSON object");
  }
  const auto fields = common::json_parse_flat(json);

  RpcEnvelope envelope;
  envelope.method = common::trim(flat_string(fields, "method"));
  if (envelope.method.empty()) {
    return common::Result<RpcEnvelope>::failure(common::ErrorCode::Validation,
                                                "method is required");
  }
  if (const auto it = fields.find("params"); it != fields.end()) {
    if (it->second.empty() || it->second.front() != '{') {
      return common::Result<RpcEnvelope>::failure(common::ErrorCode::Validation,
                                                  "params must be an object");
    }
    envelope.params_json = it->second;
  }
  if (const std::string id = common::trim(flat_string(fields, "requestId")); !id.empty()) {
    envelope.request_id = id;
  }
  return common::Result<RpcEnvelope>::success(std::move(envelope));
}

std::string rpc_response_body(const std::optional<std::string> &request_id,
                              const common::Result<std::string> &result) {
  std::ostringstream out;
  out << "{\"requestId\":" << request_id_json(request_id);
  if (result.ok()) {
    out << ",\"ok\":true,\"result\":" << as_json_value(result.value());
  } else {
    out << ",\"ok\":false,\"error\":" << error_object(result.code(), result.error());
  }
  out << "}";
  return out.str();
}

} // namespace gatewayd::gateway

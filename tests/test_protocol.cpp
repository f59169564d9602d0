#include "test_framework.hpp"

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/gateway/event_bus.hpp"
#include "gatewayd/gateway/http.hpp"
#include "gatewayd/gateway/protocol.hpp"
#include "gatewayd/gateway/registry.hpp"
#include "gatewayd/gateway/websocket.hpp"

#include <stdexcept>

#include <sys/socket.h>
#include <unistd.h>

namespace {

namespace gw = gatewayd::gateway;
namespace c = gatewayd::common;

struct SocketPair {
  int fds[2] = {-1, -1};
  SocketPair() { (void)socketpair(AF_UNIX, SOCK_STREAM, 0, fds); }
  ~SocketPair() {
    for (const int fd : fds) {
      if (fd >= 0) {
        close(fd);
      }
    }
  }
};

gw::HttpRequest upgrade_request() {
  auto parsed = gw::parse_http_request("GET /ws HTTP/1.1\r\n"
                                       "Host: localhost\r\n"
                                       "Upgrade: websocket\r\n"
                                       "Connection: keep-alive, Upgrade\r\n"
                                       "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                                       "Sec-WebSocket-Version: 13\r\n\r\n");
  return parsed.value();
}

} // namespace

void register_protocol_tests(std::vector<gatewayd::tests::TestCase> &tests) {
  using gatewayd::tests::require;

  tests.push_back({"http_parse_request_line_headers_and_query", [] {
                     const auto parsed = gw::parse_http_request(
                         "POST /hooks/deploy?x=1&name=a%20b+c HTTP/1.1\r\n"
                         "Content-Type: application/json\r\n"
                         "X-Custom:  value \r\n\r\n"
                         "{\"a\":1}");
                     require(parsed.ok(), parsed.error());
                     const auto &request = parsed.value();
                     require(request.method == "POST", "method");
                     require(request.path == "/hooks/deploy", "path without query");
                     require(request.query.at("x") == "1", "query x");
                     require(request.query.at("name") == "a b c", "query decoded");
                     require(request.header("x-custom") == "value", "header lowercased, trimmed");
                     require(request.body == "{\"a\":1}", "body");
                     require(!gw::parse_http_request("GET / HTTP/1.1\r\n").ok(),
                             "incomplete head rejected");
                   }});

  tests.push_back({"http_render_response_sets_length_and_close", [] {
                     const auto rendered =
                         gw::render_http_response(gw::make_error_response(404, "Not found"));
                     require(rendered.starts_with("HTTP/1.1 404 Not Found\r\n"), rendered);
                     require(rendered.find("Content-Length: 32\r\n") != std::string::npos,
                             "content length");
                     require(rendered.find("Connection: close\r\n") != std::string::npos,
                             "connection close");
                     require(rendered.ends_with("{\"ok\":false,\"error\":\"Not found\"}"), "body");
                   }});

  tests.push_back({"http_read_request_rejects_oversized_body", [] {
                     SocketPair pair;
                     const std::string head =
                         "POST /rpc HTTP/1.1\r\nContent-Length: " +
                         std::to_string(gw::MAX_HTTP_BODY_BYTES + 1) + "\r\n\r\n";
                     require(gw::send_all(pair.fds[0], head), "send head");
                     const auto read = gw::read_http_request(pair.fds[1]);
                     require(!read.ok() && read.error() == "request_too_large", "413 marker");
                   }});

  tests.push_back({"http_read_request_waits_for_full_body", [] {
                     SocketPair pair;
                     require(gw::send_all(pair.fds[0], "POST /rpc HTTP/1.1\r\nContent-Length: 7\r\n\r\nabc"),
                             "send first part");
                     require(gw::send_all(pair.fds[0], "defg"), "send rest");
                     const auto read = gw::read_http_request(pair.fds[1]);
                     require(read.ok(), read.error());
                     require(read.value().body == "abcdefg", "body assembled");
                   }});

  tests.push_back({"websocket_accept_matches_rfc_example", [] {
                     require(gw::websocket_accept("dGhlIHNhbXBsZSBub25jZQ==") ==
                                 "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",
                             "RFC 6455 accept value");
                     const auto request = upgrade_request();
                     require(gw::is_websocket_upgrade(request), "upgrade detected");
                     const auto response = gw::render_handshake_response(request);
                     require(response.starts_with("HTTP/1.1 101 "), "101 status");
                     require(response.find("s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") != std::string::npos,
                             "accept header");

                     auto plain = request;
                     plain.headers.erase("upgrade");
                     require(!gw::is_websocket_upgrade(plain), "plain GET is not an upgrade");
                   }});

  tests.push_back({"websocket_frames_cross_a_socket", [] {
                     SocketPair pair;
                     const std::array<std::uint8_t, 4> mask{9, 8, 7, 6};
                     const std::string large(70000, 'x');
                     require(gw::send_all(pair.fds[0],
                                          gw::encode_frame(gw::WsOpcode::Text, "hello", mask)),
                             "send masked");
                     require(gw::send_all(pair.fds[0],
                                          gw::encode_frame(gw::WsOpcode::Text, std::string(300, 'm'),
                                                           mask)),
                             "send medium");

                     auto frame = gw::read_frame(pair.fds[1]);
                     require(frame.ok() && frame.value().payload == "hello", "masked decoded");
                     frame = gw::read_frame(pair.fds[1]);
                     require(frame.ok() && frame.value().payload.size() == 300, "16-bit length");

                     require(gw::send_frame(pair.fds[1], gw::WsOpcode::Text, large),
                             "server frame");
                     frame = gw::read_frame(pair.fds[0], false);
                     require(frame.ok() && frame.value().payload == large, "64-bit length");
                   }});

  tests.push_back({"websocket_server_rejects_unmasked_and_fragmented", [] {
                     SocketPair pair;
                     require(gw::send_frame(pair.fds[0], gw::WsOpcode::Text, "plain"), "send");
                     require(!gw::read_frame(pair.fds[1]).ok(), "unmasked rejected");

                     SocketPair second;
                     auto fragment = gw::encode_frame(gw::WsOpcode::Text, "part",
                                                      std::array<std::uint8_t, 4>{1, 2, 3, 4});
                     fragment[0] = static_cast<char>(fragment[0] & 0x7F);
                     require(gw::send_all(second.fds[0], fragment), "send fragment");
                     require(!gw::read_frame(second.fds[1]).ok(), "fragment rejected");
                   }});

  tests.push_back({"protocol_parse_client_message_errors", [] {
                     auto parsed = gw::parse_client_message("not json");
                     require(!parsed.ok() && parsed.error() == "Invalid JSON payload", "bad json");
                     parsed = gw::parse_client_message("[1,2]");
                     require(!parsed.ok() && parsed.error() == "Invalid message shape", "array");
                     parsed = gw::parse_client_message("{\"type\":\"  \"}");
                     require(!parsed.ok() && parsed.error() == "Message type is required",
                             "blank type");

                     parsed = gw::parse_client_message(
                         R"({"type":"command","id":"c1","name":"message.send","payload":{"message":"hi"}})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().type == "command", "type");
                     require(parsed.value().get("id") == "c1", "id");
                     require(c::json_get_string(parsed.value().object("payload"), "message") == "hi",
                             "payload object");
                     require(parsed.value().object("missing") == "{}", "missing object");
                   }});

  tests.push_back({"protocol_keeps_string_null_values", [] {
                     auto parsed = gw::parse_client_message(
                         R"({"type":"pair","code":"GWPAIR-1","label":"null"})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get("label") == "null", "string label kept");

                     parsed = gw::parse_client_message(R"({"type":"pair","code":"c","label":null})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get("label").empty(), "null label absent");

                     parsed = gw::parse_client_message(R"({"type":"null"})");
                     require(parsed.ok() && parsed.value().type == "null", "type named null");
                   }});

  tests.push_back({"protocol_messages_are_valid_json", [] {
                     const gatewayd::security::AuthClient client{
                         .id = "client_1", .label = "a \"b\"", .token_issued_at = "t"};
                     const std::vector<std::string> messages = {
                         gw::hello_message("1.0.0", "now"),
                         gw::auth_ok_message(client),
                         gw::auth_error_message("Invalid token"),
                         gw::paired_message({.token = "gwd_x", .client = client}),
                         gw::subscription_message(true, "now"),
                         gw::pong_message(42),
                         gw::command_event_message("c1", "chunk", "{\"chunk\":\"x\"}"),
                         gw::command_result_message("c1", c::Result<std::string>::success("plain")),
                         gw::command_result_message(
                             "c1", c::Result<std::string>::failure(c::ErrorCode::HandlerError, "boom")),
                         gw::event_message({.type = "tick", .payload_json = "not json", .at = "now"}),
                         gw::rpc_error_message("Unauthorized", "now"),
                     };
                     for (const auto &message : messages) {
                       require(c::json_is_object(message), "invalid JSON: " + message);
                     }
                     require(c::json_get_string(messages[0], "type") == "hello", "hello type");
                     require(messages[0].find("\"authRequired\":true") != std::string::npos,
                             "authRequired");
                     require(messages[7].find("\"result\":\"plain\"") != std::string::npos,
                             "non-JSON result quoted");
                     require(messages[8].find("\"ok\":false,\"error\":\"boom\"") != std::string::npos,
                             "failed command");
                   }});

  tests.push_back({"protocol_rpc_envelope_and_response", [] {
                     auto envelope = gw::parse_rpc_envelope(
                         R"({"method":"gateway.status","params":{"a":1},"requestId":"r1"})");
                     require(envelope.ok(), envelope.error());
                     require(envelope.value().method == "gateway.status", "method");
                     require(envelope.value().params_json == "{\"a\":1}", "params");
                     require(envelope.value().request_id.value_or("") == "r1", "request id");

                     require(!gw::parse_rpc_envelope("{}").ok(), "method required");
                     require(!gw::parse_rpc_envelope(R"({"method":"x","params":[1]})").ok(),
                             "params must be an object");
                     require(!gw::parse_rpc_envelope("[]").ok(), "body must be object");

                     const auto failure = gw::rpc_response_body(
                         std::nullopt,
                         c::Result<std::string>::failure(c::ErrorCode::MethodNotFound, "Unknown method: x"));
                     require(failure.find("\"requestId\":null") != std::string::npos, "null id");
                     const auto error = c::json_get_object(failure, "error");
                     require(c::json_get_string(error, "code") == "METHOD_NOT_FOUND", "error code");
                   }});

  tests.push_back({"method_registry_validates_and_invokes", [] {
                     gw::MethodRegistry registry;
                     require(!registry.register_method({.id = "", .handler = [](auto &, auto &) {
                                                          return std::string("{}");
                                                        }})
                                  .ok(),
                             "empty id rejected");
                     require(!registry.register_method({.id = "x"}).ok(), "missing handler");
                     require(registry
                                 .register_method(
                                     {.id = "echo",
                                      .plugin_id = "test",
                                      .handler = [](const std::string &params,
                                                    const gw::RpcContext &ctx) {
                                        return "{\"params\":" + params + ",\"requestId\":" +
                                               c::json_quote(ctx.request_id.value_or("")) + "}";
                                      }})
                                 .ok(),
                             "register echo");
                     require(!registry
                                  .register_method({.id = "echo", .handler = [](auto &, auto &) {
                                                      return std::string("{}");
                                                    }})
                                  .ok(),
                             "duplicate rejected");
                     require(registry
                                 .register_method({.id = "boom", .handler = [](auto &, auto &) {
                                                     throw std::runtime_error("exploded");
                                                     return std::string();
                                                   }})
                                 .ok(),
                             "register boom");

                     require(registry.contains("echo") && registry.list().size() == 2, "listed");
                     const auto ok = registry.invoke("echo", "{\"a\":1}", {.request_id = "r9"});
                     require(ok.ok() && ok.value() == "{\"params\":{\"a\":1},\"requestId\":\"r9\"}",
                             "handler result");
                     const auto missing = registry.invoke("nope", "{}", {});
                     require(missing.code() == c::ErrorCode::MethodNotFound, "unknown method");
                     require(missing.error() == "Unknown method: nope", missing.error());
                     const auto thrown = registry.invoke("boom", "{}", {});
                     require(thrown.code() == c::ErrorCode::HandlerError &&
                                 thrown.error() == "exploded",
                             "throw becomes handler error");
                   }});

  tests.push_back({"route_registry_matches_method_and_path", [] {
                     gw::RouteRegistry routes;
                     const auto handler = [](const gw::HttpRequest &) {
                       return gw::make_json_response(200, "{\"ok\":true}");
                     };
                     require(routes.register_route({.method = "get", .path = "/x", .handler = handler})
                                 .ok(),
                             "register");
                     require(!routes.register_route({.method = "GET", .path = "/x", .handler = handler})
                                  .ok(),
                             "duplicate rejected");
                     require(!routes.register_route({.method = "GET", .path = "x", .handler = handler})
                                  .ok(),
                             "relative path rejected");
                     require(routes.find("GET", "/x").has_value(), "found");
                     require(!routes.find("POST", "/x").has_value(), "method must match");
                     require(routes.size() == 1, "one route");
                   }});

  tests.push_back({"event_bus_delivers_to_every_listener", [] {
                     gw::EventBus bus([] {
                       return std::chrono::system_clock::time_point(
                           std::chrono::milliseconds(1767225600000LL));
                     });
                     std::vector<gw::GatewayEvent> seen;
                     const auto first = bus.subscribe([&](const gw::GatewayEvent &event) {
                       seen.push_back(event);
                     });
                     (void)bus.subscribe([](const gw::GatewayEvent &) {
                       throw std::runtime_error("listener failure");
                     });
                     const auto third = bus.subscribe([&](const gw::GatewayEvent &event) {
                       seen.push_back(event);
                     });

                     require(bus.publish("tick", "{\"n\":1}") == 3, "three listeners invoked");
                     require(seen.size() == 2, "throwing listener does not stop the rest");
                     require(seen[0].at == "2026-01-01T00:00:00.000Z", "stamped with clock");
                     require(seen[0].payload_json == "{\"n\":1}", "payload");

                     bus.unsubscribe(first);
                     bus.unsubscribe(third);
                     require(bus.publish("tick") == 1, "one listener left");
                   }});
}

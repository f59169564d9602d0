#pragma once

#include "gatewayd/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace gatewayd::gateway {

inline constexpr std::size_t MAX_HTTP_BODY_BYTES = 64 * 1024;
inline constexpr std::size_t MAX_HTTP_HEADER_BYTES = 16 * 1024;

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  /// Header names are lowercased.
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
  std::string remote_address;

  [[nodiscard]] std::string header(const std::string &name) const;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] std::unordered_map<std::string, std::string>
parse_query_string(const std::string &query);
[[nodiscard]] std::string url_decode(const std::string &value);

/// Parses the request line and headers; everything after the blank line is
/// taken as the body.
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

[[nodiscard]] HttpResponse make_json_response(int status, const std::string &body);
[[nodiscard]] HttpResponse make_error_response(int status, const std::string &message);

/// Reads one request from `fd`: headers, then Content-Length bytes of body.
/// Validation error for malformed heads, a 413-worthy error (code
/// Validation, message "request_too_large") for bodies over the limit, Io
/// when the peer disconnects early.
[[nodiscard]] common::Result<HttpRequest> read_http_request(int fd);

/// Writes the whole buffer, retrying on short writes. False once the peer is gone.
[[nodiscard]] bool send_all(int fd, const std::string &data);

} // namespace gatewayd::gateway

#include "gatewayd/gateway/http.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/json_util.hpp"

#include <array>
#include <cerrno>
#include <charconv>
#include <sstream>

#include <sys/socket.h>
#include <unistd.h>

namespace gatewayd::gateway {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string HttpRequest::header(const std::string &name) const {
  const auto it = headers.find(common::to_lower(name));
  if (it == headers.end()) {
    return "";
  }
  return it->second;
}

std::string status_text(const int status) {
  switch (status) {
  case 101:
    return "Switching Protocols";
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 426:
    return "Upgrade Required";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

std::string url_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '+') {
      out.push_back(' ');
    } else if (ch == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
               hex_value(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
      i += 2;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[url_decode(part)] = "";
      continue;
    }
    out[url_decode(part.substr(0, eq))] = url_decode(part.substr(eq + 1));
  }
  return out;
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  const std::string body = raw.substr(header_end + 4);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    const std::string value = common::trim(line.substr(colon + 1));
    request.headers[key] = value;
  }

  request.body = body;
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_error_response(const int status, const std::string &message) {
  return make_json_response(status, "{\"ok\":false,\"error\":" + common::json_quote(message) + "}");
}

common::Result<HttpRequest> read_http_request(const int fd) {
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  std::size_t header_end = std::string::npos;
  while (header_end == std::string::npos) {
    if (raw.size() > MAX_HTTP_HEADER_BYTES) {
      return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                  "request headers too large");
    }
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return common::Result<HttpRequest>::failure(common::ErrorCode::Io,
                                                  "connection closed before headers");
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));
    header_end = raw.find("\r\n\r\n");
  }

  auto head = parse_http_request(raw.substr(0, header_end + 4));
  if (!head.ok()) {
    return head;
  }

  std::size_t content_length = 0;
  if (const std::string cl = head.value().header("content-length"); !cl.empty()) {
    const auto *first = cl.data();
    const auto *last = first + cl.size();
    auto [ptr, ec] = std::from_chars(first, last, content_length);
    if (ec != std::errc() || ptr != last) {
      return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                  "invalid content-length");
    }
  }
  if (content_length > MAX_HTTP_BODY_BYTES) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "request_too_large");
  }

  while (raw.size() < header_end + 4 + content_length) {
    const ssize_t n = recv(fd, buf.data(), buf.size(), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return common::Result<HttpRequest>::failure(common::ErrorCode::Io,
                                                  "connection closed before body");
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));
  }

  auto request = std::move(head.value());
  request.body = raw.substr(header_end + 4, content_length);
  return common::Result<HttpRequest>::success(std::move(request));
}

bool send_all(const int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace gatewayd::gateway

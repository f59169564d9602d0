#include "tests/helpers/test_helpers.hpp"

#include "gatewayd/common/json_util.hpp"
#include "gatewayd/gateway/http.hpp"
#include "gatewayd/gateway/websocket.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace gatewayd::testing {

namespace {

int connect_localhost(const std::uint16_t port) {
  const int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return -1;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    ::close(sock);
    return -1;
  }
  return sock;
}

void set_timeout(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  (void)setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // namespace

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("gatewayd-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::string TempDir::read_file(const std::string &name) const {
  std::ifstream in(path_ / name);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ManualClock::ManualClock(const std::chrono::system_clock::time_point start)
    : state_(std::make_shared<State>()) {
  state_->now = start;
}

common::Clock ManualClock::clock() const {
  return [state = state_]() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->now;
  };
}

void ManualClock::advance(const std::chrono::milliseconds by) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->now += by;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

HttpReply http_request(const std::uint16_t port, const std::string &method,
                       const std::string &path, const std::string &body,
                       const std::unordered_map<std::string, std::string> &headers) {
  HttpReply reply;
  const int sock = connect_localhost(port);
  if (sock < 0) {
    return reply;
  }
  set_timeout(sock, std::chrono::milliseconds(5000));

  std::ostringstream request;
  request << method << " " << path << " HTTP/1.1\r\n"
          << "Host: 127.0.0.1:" << port << "\r\n"
          << "Connection: close\r\n";
  for (const auto &[key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  if (!body.empty() || method == "POST") {
    request << "Content-Length: " << body.size() << "\r\n";
  }
  request << "\r\n" << body;

  if (!gateway::send_all(sock, request.str())) {
    ::close(sock);
    return reply;
  }

  std::string raw;
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t n = recv(sock, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));
  }
  ::close(sock);

  const auto space = raw.find(' ');
  if (!raw.starts_with("HTTP/1.1 ") || space == std::string::npos) {
    return reply;
  }
  reply.status = std::atoi(raw.c_str() + space + 1);
  if (const auto header_end = raw.find("\r\n\r\n"); header_end != std::string::npos) {
    reply.body = raw.substr(header_end + 4);
  }
  return reply;
}

WsTestClient::~WsTestClient() { close(); }

bool WsTestClient::connect(const std::uint16_t port, const std::string &path) {
  close();
  fd_ = connect_localhost(port);
  if (fd_ < 0) {
    return false;
  }
  set_timeout(fd_, std::chrono::milliseconds(3000));

  const std::string handshake = "GET " + path + " HTTP/1.1\r\n"
                                "Host: 127.0.0.1:" + std::to_string(port) + "\r\n"
                                "Upgrade: websocket\r\n"
                                "Connection: Upgrade\r\n"
                                "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                                "Sec-WebSocket-Version: 13\r\n\r\n";
  if (!gateway::send_all(fd_, handshake)) {
    close();
    return false;
  }

  // Byte at a time so no frame data sent right after the 101 is swallowed.
  std::string head;
  char ch = 0;
  while (head.find("\r\n\r\n") == std::string::npos && head.size() < 8192) {
    if (recv(fd_, &ch, 1, 0) != 1) {
      close();
      return false;
    }
    head.push_back(ch);
  }
  if (head.find(" 101 ") == std::string::npos ||
      head.find(gateway::websocket_accept("dGhlIHNhbXBsZSBub25jZQ==")) == std::string::npos) {
    close();
    return false;
  }
  return true;
}

bool WsTestClient::send_text(const std::string &text) {
  if (fd_ < 0) {
    return false;
  }
  const std::array<std::uint8_t, 4> mask{0x12, 0x34, 0x56, 0x78};
  return gateway::send_all(fd_, gateway::encode_frame(gateway::WsOpcode::Text, text, mask));
}

std::optional<std::string> WsTestClient::read_text(const std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    return std::nullopt;
  }
  set_timeout(fd_, timeout);
  while (true) {
    auto frame = gateway::read_frame(fd_, false);
    if (!frame.ok()) {
      return std::nullopt;
    }
    if (frame.value().opcode == gateway::WsOpcode::Text ||
        frame.value().opcode == gateway::WsOpcode::Binary) {
      return frame.value().payload;
    }
    if (frame.value().opcode == gateway::WsOpcode::Close) {
      return std::nullopt;
    }
  }
}

std::optional<std::string> WsTestClient::read_until_type(const std::string &type,
                                                         const std::chrono::milliseconds timeout,
                                                         std::vector<std::string> *skipped) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return std::nullopt;
    }
    auto message = read_text(remaining);
    if (!message.has_value()) {
      return std::nullopt;
    }
    if (type_of(*message) == type) {
      return message;
    }
    if (skipped != nullptr) {
      skipped->push_back(*message);
    }
  }
}

void WsTestClient::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool connect_and_greet(WsTestClient &client, const std::uint16_t port) {
  if (!client.connect(port)) {
    return false;
  }
  const auto hello = client.read_text();
  return hello.has_value() && type_of(*hello) == "hello";
}

std::string type_of(const std::string &message) {
  return common::json_get_string(message, "type");
}

} // namespace gatewayd::testing

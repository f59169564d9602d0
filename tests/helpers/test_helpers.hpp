#pragma once

#include "gatewayd/common/time.hpp"
#include "gatewayd/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gatewayd::testing {

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Clock that only moves when told to.
class ManualClock {
public:
  explicit ManualClock(std::chrono::system_clock::time_point start =
                           std::chrono::system_clock::now());

  [[nodiscard]] common::Clock clock() const;
  void advance(std::chrono::milliseconds by);

private:
  struct State {
    std::mutex mutex;
    std::chrono::system_clock::time_point now;
  };
  std::shared_ptr<State> state_;
};

/// Keeps every event and metric for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

struct HttpReply {
  int status = 0;
  std::string body;
};

/// One request against 127.0.0.1:port with Connection: close. status 0 when
/// the request could not be sent or no status line came back.
[[nodiscard]] HttpReply http_request(std::uint16_t port, const std::string &method,
                                     const std::string &path, const std::string &body = "",
                                     const std::unordered_map<std::string, std::string> &headers =
                                         {});

/// Minimal WebSocket client for driving the gateway over a real socket.
class WsTestClient {
public:
  WsTestClient() = default;
  ~WsTestClient();

  WsTestClient(const WsTestClient &) = delete;
  WsTestClient &operator=(const WsTestClient &) = delete;

  [[nodiscard]] bool connect(std::uint16_t port, const std::string &path = "/ws");
  [[nodiscard]] bool send_text(const std::string &text);
  /// Next text frame, or nullopt on timeout or close.
  [[nodiscard]] std::optional<std::string>
  read_text(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));
  /// Reads frames until one has the given "type"; earlier frames are appended
  /// to `skipped` when provided.
  [[nodiscard]] std::optional<std::string>
  read_until_type(const std::string &type,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(3000),
                  std::vector<std::string> *skipped = nullptr);
  void close();

private:
  int fd_ = -1;
};

/// Connects, consumes the hello frame and returns true when it arrived.
[[nodiscard]] bool connect_and_greet(WsTestClient &client, std::uint16_t port);

[[nodiscard]] std::string type_of(const std::string &message);

} // namespace gatewayd::testing

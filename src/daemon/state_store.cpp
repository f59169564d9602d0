#include "gatewayd/daemon/state_store.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace gatewayd::daemon {

namespace {

template <typename T> std::optional<T> parse_number(const std::string &text) {
  T value{};
  const auto *first = text.data();
  const auto *last = first + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::string field(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? "" : it->second;
}

} // namespace

std::string serialize_daemon_record(const DaemonRecord &record) {
  std::ostringstream out;
  out << "{\n"
      << "  \"pid\": " << record.pid << ",\n"
      << "  \"startedAt\": " << common::json_quote(record.started_at) << ",\n"
      << "  \"host\": " << common::json_quote(record.host) << ",\n"
      << "  \"port\": " << record.port << ",\n"
      << "  \"version\": " << common::json_quote(record.version) << "\n"
      << "}\n";
  return out.str();
}

common::Result<DaemonRecord> parse_daemon_record(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<DaemonRecord>::failure(common::ErrorCode::Validation,
                                                 "daemon record is not a JSON object");
  }
  const auto fields = common::json_parse_flat(json);

  const auto pid = parse_number<int>(field(fields, "pid"));
  const auto port = parse_number<std::uint16_t>(field(fields, "port"));
  if (!pid.has_value() || *pid <= 0 || !port.has_value()) {
    return common::Result<DaemonRecord>::failure(common::ErrorCode::Validation,
                                                 "daemon record needs a pid and a port");
  }

  return common::Result<DaemonRecord>::success(DaemonRecord{
      .pid = *pid,
      .started_at = field(fields, "startedAt"),
      .host = field(fields, "host"),
      .port = *port,
      .version = field(fields, "version"),
  });
}

DaemonStateStore::DaemonStateStore(std::filesystem::path state_dir)
    : state_dir_(std::move(state_dir)), pid_file_(state_dir_ / PID_FILE_NAME) {}

std::filesystem::path DaemonStateStore::record_path() const {
  return state_dir_ / STATE_FILE_NAME;
}

common::Status DaemonStateStore::write(const DaemonRecord &record) const {
  return common::write_file_atomic(record_path(), serialize_daemon_record(record));
}

std::optional<DaemonRecord> DaemonStateStore::read() const {
  auto content = common::read_file(record_path());
  if (!content.ok()) {
    return std::nullopt;
  }
  auto record = parse_daemon_record(content.value());
  if (!record.ok()) {
    return std::nullopt;
  }
  return record.value();
}

common::Status DaemonStateStore::write_pid(const int pid) const { return pid_file_.write(pid); }

std::optional<int> DaemonStateStore::read_pid() const { return pid_file_.read(); }

common::Status DaemonStateStore::clear() const {
  const auto pid_cleared = pid_file_.clear();
  const auto record_cleared = common::remove_file(record_path());
  if (!pid_cleared.ok()) {
    return pid_cleared;
  }
  return record_cleared;
}

DaemonStatus DaemonStateStore::status() const {
  DaemonStatus status;
  status.record = read();
  status.pid = read_pid();
  if (!status.pid.has_value()) {
    return status;
  }
  status.running = PidFile::is_process_running(*status.pid);
  return status;
}

} // namespace gatewayd::daemon

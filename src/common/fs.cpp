#include "gatewayd/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace gatewayd::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::NotFound, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<std::string>::failure(ErrorCode::NotFound, "file not found: " + path.string());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::Io, "failed to open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  // Unique per process so two writers never share a temp file.
  const auto temp_path =
      std::filesystem::path(path.string() + "." + std::to_string(getpid()) + ".tmp");
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::Io, "failed to open " + temp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      return Status::error(ErrorCode::Io, "failed to write " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return Status::error(ErrorCode::Io, "failed to replace " + path.string() + ": " +
                                            ec.message());
  }
  return Status::success();
}

Status remove_file(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return Status::error(ErrorCode::Io, "failed to remove " + path.string() + ": " +
                                            ec.message());
  }
  return Status::success();
}

} // namespace gatewayd::common

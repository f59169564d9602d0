#pragma once

#include "gatewayd/common/result.hpp"
#include <filesystem>
#include <string>

namespace gatewayd::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Reads the whole file. NotFound when it does not exist.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes to a sibling temp file and renames it over `path`, so readers see
/// either the old or the new content and never a partial write.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Removes the file if present. A missing file is not an error.
[[nodiscard]] Status remove_file(const std::filesystem::path &path);

} // namespace gatewayd::common

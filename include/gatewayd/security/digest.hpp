#pragma once

#include "gatewayd/common/result.hpp"

#include <cstddef>
#include <string>

namespace gatewayd::security {

/// Lowercase hex SHA-256 of `text`.
[[nodiscard]] std::string sha256_hex(const std::string &text);

/// `bytes` bytes from the OpenSSL CSPRNG, hex encoded.
[[nodiscard]] common::Result<std::string> random_hex(std::size_t bytes);

/// Fixed-time comparison of two digests. Runs over the longer input so the
/// time does not reveal the position of the first mismatch.
[[nodiscard]] bool digest_equals(const std::string &a, const std::string &b);

/// Fixed-time comparison of two secrets of arbitrary length; both sides are
/// hashed first so the length of the expected value does not leak.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

} // namespace gatewayd::security

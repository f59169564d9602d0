#include "gatewayd/security/digest.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace gatewayd::security {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, sizeof(digest));
}

common::Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure(common::ErrorCode::Internal,
                                                "RAND_bytes failed");
  }
  return common::Result<std::string>::success(to_hex(data.data(), data.size()));
}

bool digest_equals(const std::string &a, const std::string &b) {
  const std::size_t max_size = std::max(a.size(), b.size());
  unsigned char diff = static_cast<unsigned char>(a.size() != b.size());

  for (std::size_t i = 0; i < max_size; ++i) {
    const unsigned char lhs = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const unsigned char rhs = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(lhs ^ rhs);
  }

  return diff == 0;
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  return digest_equals(sha256_hex(a), sha256_hex(b));
}

} // namespace gatewayd::security

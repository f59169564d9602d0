#pragma once

#include "gatewayd/common/result.hpp"
#include "gatewayd/common/time.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gatewayd::security {

inline constexpr std::size_t MAX_ACTIVE_TOKENS = 64;
inline constexpr std::size_t MAX_LABEL_LENGTH = 80;
inline constexpr const char *DEFAULT_CLIENT_LABEL = "gateway-client";

struct PairingCodeRecord {
  std::string id;
  std::string hash;
  std::string label;
  std::string created_at;
  std::string expires_at;
  std::optional<std::string> used_at;
};

struct AccessTokenRecord {
  std::string id;
  std::string hash;
  std::string label;
  std::string created_at;
  std::optional<std::string> last_used_at;
  std::optional<std::string> revoked_at;
};

/// Contents of the credential file. Holds digests only.
struct CredentialStore {
  std::vector<PairingCodeRecord> pairing_codes;
  std::vector<AccessTokenRecord> tokens;
};

[[nodiscard]] std::string serialize_credential_store(const CredentialStore &store);
/// Lenient: unknown fields are ignored and records missing an id or hash are
/// skipped. Fails only when the document is not a JSON object.
[[nodiscard]] common::Result<CredentialStore> parse_credential_store(const std::string &json);

/// Trims, defaults to "gateway-client" and caps at 80 bytes.
[[nodiscard]] std::string normalize_label(const std::string &label);

struct CreatedPairingCode {
  std::string code;
  std::string label;
  std::string expires_at;
};

struct AuthClient {
  std::string id;
  std::string label;
  std::string token_issued_at;
};

struct IssuedToken {
  std::string token;
  AuthClient client;
};

struct CredentialSummary {
  std::size_t active_tokens = 0;
  std::size_t pending_pairing_codes = 0;
  std::optional<std::string> latest_pairing_expiry;
};

struct CredentialOptions {
  std::filesystem::path auth_file;
  std::chrono::seconds default_pairing_ttl{600};
  std::chrono::seconds min_pairing_ttl{30};
  common::Clock clock = common::system_clock();
};

/// Pairing codes and access tokens backed by one JSON file.
///
/// Every operation takes the manager's lock, re-reads the file and prunes
/// dead records before deciding, so codes minted by another process (the
/// CLI `pair` command) are visible to the running daemon. Mutations are
/// written back with an atomic replace.
class CredentialManager {
public:
  explicit CredentialManager(CredentialOptions options);

  /// Reads, prunes and rewrites the file. A missing or corrupt file starts
  /// an empty store.
  [[nodiscard]] common::Status load();

  [[nodiscard]] common::Result<CreatedPairingCode>
  create_pairing_code(const std::string &label,
                      std::optional<std::chrono::seconds> ttl = std::nullopt);

  /// nullopt for an empty, unknown, used or expired code. The caller cannot
  /// tell these apart.
  [[nodiscard]] std::optional<IssuedToken>
  consume_pairing_code(const std::string &code,
                       const std::optional<std::string> &label = std::nullopt);

  [[nodiscard]] std::optional<AuthClient> authenticate(const std::string &token);
  [[nodiscard]] std::optional<IssuedToken> rotate_token(const std::string &current_token);
  [[nodiscard]] bool revoke_client(const std::string &client_id);
  [[nodiscard]] CredentialSummary summary();

  [[nodiscard]] const std::filesystem::path &auth_file() const { return options_.auth_file; }

private:
  [[nodiscard]] CredentialStore read_locked() const;
  void prune_locked(CredentialStore &store) const;
  [[nodiscard]] common::Status persist_locked(const CredentialStore &store) const;
  [[nodiscard]] common::Result<IssuedToken> issue_token_locked(CredentialStore &store,
                                                               const std::string &label) const;
  [[nodiscard]] std::string now_iso() const;

  CredentialOptions options_;
  mutable std::mutex mutex_;
};

} // namespace gatewayd::security

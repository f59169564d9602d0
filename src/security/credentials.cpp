#include "gatewayd/security/credentials.hpp"

#include "gatewayd/common/fs.hpp"
#include "gatewayd/common/json_util.hpp"
#include "gatewayd/observability/global.hpp"
#include "gatewayd/security/digest.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace gatewayd::security {

namespace {

constexpr const char *PAIRING_CODE_PREFIX = "GWPAIR-";
constexpr const char *ACCESS_TOKEN_PREFIX = "gwd_";
constexpr std::size_t PAIRING_CODE_BYTES = 5;
constexpr std::size_t ACCESS_TOKEN_BYTES = 24;
constexpr std::size_t ID_BYTES = 8;

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

common::Result<std::string> generate_id(const std::string &prefix) {
  auto hex = random_hex(ID_BYTES);
  if (!hex.ok()) {
    return hex;
  }
  return common::Result<std::string>::success(prefix + "_" + hex.value());
}

std::optional<std::string> optional_field(const common::JsonFlatMap &fields,
                                          const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

std::string field_or_empty(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  return it == fields.end() ? "" : it->second;
}

std::chrono::system_clock::time_point parse_or_epoch(const std::string &value) {
  return common::parse_rfc3339(value).value_or(std::chrono::system_clock::time_point{});
}

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << ", \"" << key << "\": " << common::json_quote(*value);
  }
}

AuthClient client_from(const AccessTokenRecord &record) {
  return AuthClient{.id = record.id, .label = record.label, .token_issued_at = record.created_at};
}

} // namespace

std::string serialize_credential_store(const CredentialStore &store) {
  std::ostringstream out;
  out << "{\n  \"version\": 1,\n  \"pairingCodes\": [";
  for (std::size_t i = 0; i < store.pairing_codes.size(); ++i) {
    const auto &code = store.pairing_codes[i];
    out << (i == 0 ? "\n" : ",\n") << "    {";
    out << "\"id\": " << common::json_quote(code.id);
    out << ", \"hash\": " << common::json_quote(code.hash);
    out << ", \"label\": " << common::json_quote(code.label);
    out << ", \"createdAt\": " << common::json_quote(code.created_at);
    out << ", \"expiresAt\": " << common::json_quote(code.expires_at);
    write_optional(out, "usedAt", code.used_at);
    out << "}";
  }
  out << (store.pairing_codes.empty() ? "]" : "\n  ]") << ",\n  \"tokens\": [";
  for (std::size_t i = 0; i < store.tokens.size(); ++i) {
    const auto &token = store.tokens[i];
    out << (i == 0 ? "\n" : ",\n") << "    {";
    out << "\"id\": " << common::json_quote(token.id);
    out << ", \"hash\": " << common::json_quote(token.hash);
    out << ", \"label\": " << common::json_quote(token.label);
    out << ", \"createdAt\": " << common::json_quote(token.created_at);
    write_optional(out, "lastUsedAt", token.last_used_at);
    write_optional(out, "revokedAt", token.revoked_at);
    out << "}";
  }
  out << (store.tokens.empty() ? "]" : "\n  ]") << "\n}\n";
  return out.str();
}

common::Result<CredentialStore> parse_credential_store(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<CredentialStore>::failure(common::ErrorCode::Validation,
                                                    "credential file is not a JSON object");
  }

  const auto top = common::json_parse_flat(json);
  CredentialStore store;

  for (const auto &raw : common::json_split_top_level_objects(field_or_empty(top, "pairingCodes"))) {
    const auto fields = common::json_parse_flat(raw);
    PairingCodeRecord record{
        .id = field_or_empty(fields, "id"),
        .hash = field_or_empty(fields, "hash"),
        .label = normalize_label(field_or_empty(fields, "label")),
        .created_at = field_or_empty(fields, "createdAt"),
        .expires_at = field_or_empty(fields, "expiresAt"),
        .used_at = optional_field(fields, "usedAt"),
    };
    if (record.id.empty() || record.hash.empty()) {
      continue;
    }
    store.pairing_codes.push_back(std::move(record));
  }

  for (const auto &raw : common::json_split_top_level_objects(field_or_empty(top, "tokens"))) {
    const auto fields = common::json_parse_flat(raw);
    AccessTokenRecord record{
        .id = field_or_empty(fields, "id"),
        .hash = field_or_empty(fields, "hash"),
        .label = normalize_label(field_or_empty(fields, "label")),
        .created_at = field_or_empty(fields, "createdAt"),
        .last_used_at = optional_field(fields, "lastUsedAt"),
        .revoked_at = optional_field(fields, "revokedAt"),
    };
    if (record.id.empty() || record.hash.empty()) {
      continue;
    }
    store.tokens.push_back(std::move(record));
  }

  return common::Result<CredentialStore>::success(std::move(store));
}

std::string normalize_label(const std::string &label) {
  std::string normalized = common::trim(label);
  if (normalized.empty()) {
    return DEFAULT_CLIENT_LABEL;
  }
  if (normalized.size() > MAX_LABEL_LENGTH) {
    normalized.resize(MAX_LABEL_LENGTH);
    // Drop a UTF-8 sequence cut in half by the resize.
    std::size_t cut = normalized.size();
    while (cut > 0 && (static_cast<unsigned char>(normalized[cut - 1]) & 0xC0) == 0x80) {
      --cut;
    }
    if (cut > 0 && (static_cast<unsigned char>(normalized[cut - 1]) & 0x80) != 0) {
      const auto lead = static_cast<unsigned char>(normalized[cut - 1]);
      const std::size_t expected = (lead & 0xE0) == 0xC0   ? 2
                                   : (lead & 0xF0) == 0xE0 ? 3
                                   : (lead & 0xF8) == 0xF0 ? 4
                                                           : 1;
      if (normalized.size() - (cut - 1) < expected) {
        normalized.resize(cut - 1);
      }
    }
    normalized = common::trim(normalized);
  }
  return normalized;
}

CredentialManager::CredentialManager(CredentialOptions options) : options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = common::system_clock();
  }
}

std::string CredentialManager::now_iso() const { return common::format_rfc3339(options_.clock()); }

CredentialStore CredentialManager::read_locked() const {
  const auto content = common::read_file(options_.auth_file);
  if (!content.ok()) {
    if (content.code() != common::ErrorCode::NotFound) {
      observability::record_error("credentials", content.error());
    }
    return {};
  }
  auto parsed = parse_credential_store(content.value());
  if (!parsed.ok()) {
    observability::record_error("credentials", options_.auth_file.string() + ": " +
                                                   parsed.error() + "; starting empty");
    return {};
  }
  auto store = std::move(parsed.value());
  prune_locked(store);
  return store;
}

void CredentialManager::prune_locked(CredentialStore &store) const {
  const auto now = options_.clock();

  std::erase_if(store.pairing_codes, [&](const PairingCodeRecord &record) {
    if (record.used_at.has_value()) {
      return true;
    }
    const auto expires = common::parse_rfc3339(record.expires_at);
    return !expires.has_value() || *expires <= now;
  });

  std::erase_if(store.tokens,
                [](const AccessTokenRecord &record) { return record.revoked_at.has_value(); });
  if (store.tokens.size() <= MAX_ACTIVE_TOKENS) {
    return;
  }

  std::stable_sort(store.tokens.begin(), store.tokens.end(),
                   [](const AccessTokenRecord &a, const AccessTokenRecord &b) {
                     return parse_or_epoch(a.created_at) < parse_or_epoch(b.created_at);
                   });
  store.tokens.erase(store.tokens.begin(),
                     store.tokens.end() - static_cast<std::ptrdiff_t>(MAX_ACTIVE_TOKENS));
}

common::Status CredentialManager::persist_locked(const CredentialStore &store) const {
  auto status = common::write_file_atomic(options_.auth_file, serialize_credential_store(store));
  if (!status.ok()) {
    observability::record_error("credentials", status.error());
  }
  return status;
}

common::Result<IssuedToken> CredentialManager::issue_token_locked(CredentialStore &store,
                                                                  const std::string &label) const {
  auto secret = random_hex(ACCESS_TOKEN_BYTES);
  if (!secret.ok()) {
    return common::Result<IssuedToken>::failure(secret.status());
  }
  auto id = generate_id("client");
  if (!id.ok()) {
    return common::Result<IssuedToken>::failure(id.status());
  }

  const std::string token = ACCESS_TOKEN_PREFIX + secret.value();
  AccessTokenRecord record{
      .id = id.value(),
      .hash = sha256_hex(token),
      .label = normalize_label(label),
      .created_at = now_iso(),
  };
  IssuedToken issued{.token = token, .client = client_from(record)};
  store.tokens.push_back(std::move(record));
  prune_locked(store);
  return common::Result<IssuedToken>::success(std::move(issued));
}

common::Status CredentialManager::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  return persist_locked(read_locked());
}

common::Result<CreatedPairingCode>
CredentialManager::create_pairing_code(const std::string &label,
                                       std::optional<std::chrono::seconds> ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto store = read_locked();

  auto secret = random_hex(PAIRING_CODE_BYTES);
  if (!secret.ok()) {
    return common::Result<CreatedPairingCode>::failure(secret.status());
  }
  auto id = generate_id("pair");
  if (!id.ok()) {
    return common::Result<CreatedPairingCode>::failure(id.status());
  }

  const auto effective_ttl = std::max(ttl.value_or(options_.default_pairing_ttl),
                                      options_.min_pairing_ttl);
  const auto now = options_.clock();
  const std::string code = PAIRING_CODE_PREFIX + to_upper(secret.value());
  const std::string normalized_label = normalize_label(label);
  const std::string expires_at = common::format_rfc3339(now + effective_ttl);

  store.pairing_codes.push_back(PairingCodeRecord{
      .id = id.value(),
      .hash = sha256_hex(code),
      .label = normalized_label,
      .created_at = common::format_rfc3339(now),
      .expires_at = expires_at,
  });

  auto status = persist_locked(store);
  if (!status.ok()) {
    return common::Result<CreatedPairingCode>::failure(status);
  }
  return common::Result<CreatedPairingCode>::success(
      CreatedPairingCode{.code = code, .label = normalized_label, .expires_at = expires_at});
}

std::optional<IssuedToken>
CredentialManager::consume_pairing_code(const std::string &code,
                                        const std::optional<std::string> &label) {
  const std::string normalized = common::trim(code);
  if (normalized.empty()) {
    return std::nullopt;
  }
  const std::string candidate = sha256_hex(normalized);

  std::lock_guard<std::mutex> lock(mutex_);
  auto store = read_locked();

  // Pruning already removed used and expired codes.
  auto it = std::find_if(store.pairing_codes.begin(), store.pairing_codes.end(),
                         [&](const PairingCodeRecord &record) {
                           return digest_equals(record.hash, candidate);
                         });
  if (it == store.pairing_codes.end()) {
    return std::nullopt;
  }

  it->used_at = now_iso();
  const std::string token_label =
      label.has_value() && !common::trim(*label).empty() ? *label : it->label;
  auto issued = issue_token_locked(store, token_label);
  if (!issued.ok()) {
    observability::record_error("credentials", issued.error());
    return std::nullopt;
  }
  // The code must be durably marked used before the token is handed out.
  if (!persist_locked(store).ok()) {
    return std::nullopt;
  }
  return std::move(issued.value());
}

std::optional<AuthClient> CredentialManager::authenticate(const std::string &token) {
  const std::string normalized = common::trim(token);
  if (normalized.empty()) {
    return std::nullopt;
  }
  const std::string candidate = sha256_hex(normalized);

  std::lock_guard<std::mutex> lock(mutex_);
  auto store = read_locked();
  auto it = std::find_if(store.tokens.begin(), store.tokens.end(),
                         [&](const AccessTokenRecord &record) {
                           return digest_equals(record.hash, candidate);
                         });
  if (it == store.tokens.end()) {
    return std::nullopt;
  }

  it->last_used_at = now_iso();
  const auto client = client_from(*it);
  // A failed lastUsedAt write does not invalidate a good token.
  (void)persist_locked(store);
  return client;
}

std::optional<IssuedToken> CredentialManager::rotate_token(const std::string &current_token) {
  const std::string normalized = common::trim(current_token);
  if (normalized.empty()) {
    return std::nullopt;
  }
  const std::string candidate = sha256_hex(normalized);

  std::lock_guard<std::mutex> lock(mutex_);
  auto store = read_locked();
  auto it = std::find_if(store.tokens.begin(), store.tokens.end(),
                         [&](const AccessTokenRecord &record) {
                           return digest_equals(record.hash, candidate);
                         });
  if (it == store.tokens.end()) {
    return std::nullopt;
  }

  it->revoked_at = now_iso();
  const std::string label = it->label;
  auto issued = issue_token_locked(store, label);
  if (!issued.ok()) {
    observability::record_error("credentials", issued.error());
    return std::nullopt;
  }
  if (!persist_locked(store).ok()) {
    return std::nullopt;
  }
  return std::move(issued.value());
}

bool CredentialManager::revoke_client(const std::string &client_id) {
  const std::string normalized = common::trim(client_id);
  if (normalized.empty()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto store = read_locked();
  auto it = std::find_if(store.tokens.begin(), store.tokens.end(),
                         [&](const AccessTokenRecord &record) { return record.id == normalized; });
  if (it == store.tokens.end()) {
    return false;
  }
  it->revoked_at = now_iso();
  prune_locked(store);
  return persist_locked(store).ok();
}

CredentialSummary CredentialManager::summary() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto store = read_locked();

  CredentialSummary result;
  result.active_tokens = store.tokens.size();
  result.pending_pairing_codes = store.pairing_codes.size();
  for (const auto &record : store.pairing_codes) {
    if (!result.latest_pairing_expiry.has_value() ||
        parse_or_epoch(record.expires_at) > parse_or_epoch(*result.latest_pairing_expiry)) {
      result.latest_pairing_expiry = record.expires_at;
    }
  }
  (void)persist_locked(store);
  return result;
}

} // namespace gatewayd::security

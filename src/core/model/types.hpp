#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sealtrail {

enum class ErrorKind {
  None,
  Validation,
  Store,
  Crypto,
};

struct Result {
  bool ok = false;
  std::string message;
  std::string data;
  ErrorKind kind = ErrorKind::None;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload), ErrorKind::None};
  }

  static Result failure(std::string msg, ErrorKind kind = ErrorKind::Store) {
    return {false, std::move(msg), {}, kind};
  }
};

enum class EventCategory {
  Unspecified,
  Payment,
  Auth,
  DataAccess,
  Admin,
};

enum class Outcome {
  Success,
  Failure,
};

enum class RiskLevel {
  Low,
  Medium,
  High,
};

enum class ComplianceTag {
  PciDss,
  Sox,
  Gdpr,
  Aml,
  FinancialRecord,
  PrivacyData,
};

struct MetaField;

// Free-form metadata node: a scalar rendered as text, an object of named fields, or a list.
struct MetaValue {
  enum class Kind {
    Text,
    Object,
    List,
  };

  Kind kind = Kind::Text;
  std::string text;
  std::vector<MetaField> fields;
  std::vector<MetaValue> items;

  static MetaValue of(std::string value);
  static MetaValue object(std::vector<MetaField> fields);
  static MetaValue list(std::vector<MetaValue> items);

  [[nodiscard]] bool is_object() const { return kind == Kind::Object; }
  [[nodiscard]] const MetaValue* find(std::string_view key) const;
};

struct MetaField {
  std::string key;
  MetaValue value;
};

inline MetaValue MetaValue::of(std::string value) {
  MetaValue out;
  out.kind = Kind::Text;
  out.text = std::move(value);
  return out;
}

inline MetaValue MetaValue::object(std::vector<MetaField> fields) {
  MetaValue out;
  out.kind = Kind::Object;
  out.fields = std::move(fields);
  return out;
}

inline MetaValue MetaValue::list(std::vector<MetaValue> items) {
  MetaValue out;
  out.kind = Kind::List;
  out.items = std::move(items);
  return out;
}

inline const MetaValue* MetaValue::find(std::string_view key) const {
  for (const auto& field : fields) {
    if (field.key == key) {
      return &field.value;
    }
  }
  return nullptr;
}

struct ChangeSnapshot {
  MetaValue before;
  MetaValue after;
};

struct AuditEvent {
  EventCategory category = EventCategory::Unspecified;
  std::string actor_id;
  std::string device_id;
  std::string action;
  std::string resource;
  Outcome result = Outcome::Success;
  std::string network_origin;
  std::string user_agent;
  std::string correlation_id;
  MetaValue metadata = MetaValue::object({});
  RiskLevel risk_level = RiskLevel::Medium;
  bool sensitive_data_accessed = false;
  std::set<ComplianceTag> compliance_tags;
  std::optional<ChangeSnapshot> changes;
};

// Only the Sanitizer produces these; the chain never sees a raw AuditEvent.
struct SanitizedEvent : AuditEvent {};

struct AuditLog {
  SanitizedEvent event;
  std::int64_t timestamp_ms = 0;
};

struct SecureAuditEntry {
  std::string id;
  AuditLog log;
  std::uint64_t block_number = 0;
  std::string previous_hash;
  std::string hash;
  std::string signature;
  std::int64_t created_at_ms = 0;
};

// Persisted form of a SecureAuditEntry: the log body is replaced by its ciphertext.
struct SealedEntry {
  std::string id;
  std::string encrypted_log;
  std::uint64_t block_number = 0;
  std::string previous_hash;
  std::string hash;
  std::string signature;
  std::int64_t created_at_ms = 0;
  std::set<ComplianceTag> compliance_tags;
};

struct ChainTip {
  std::uint64_t block_number = 0;
  std::string hash;
};

struct SanitizerPolicy {
  std::vector<std::string> sensitive_field_patterns = {"password", "secret", "token", "key",
                                                       "card",     "ssn",    "cvv"};
  std::string redaction_token = "[REDACTED]";
};

struct AuditConfig {
  std::string data_dir;
  std::string store_backend = "file";
  std::string signing_key_hex;
  std::string encryption_key_hex;
  SanitizerPolicy sanitizer{};
  std::uint32_t store_retry_attempts = 3;
  std::uint32_t store_retry_backoff_ms = 25;
  std::string log_level = "info";
};

}  // namespace sealtrail

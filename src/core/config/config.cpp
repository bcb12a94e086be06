#include "core/config/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace sealtrail {
namespace {

bool parse_uint32(std::string_view text, std::uint32_t& out) {
  std::uint32_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

void override_from_env(const char* name, std::string& target) {
  const char* value = std::getenv(name);
  if (value != nullptr && *value != '\0') {
    target = value;
  }
}

Result check_key(std::string_view hex, std::string_view label) {
  if (hex.empty()) {
    return Result::failure(std::string{label} + " is not configured.", ErrorKind::Crypto);
  }
  if (util::from_hex(hex).size() != kSecretKeyBytes) {
    return Result::failure(std::string{label} + " must be " + std::to_string(kSecretKeyBytes) +
                               " bytes of hex.",
                           ErrorKind::Crypto);
  }
  return Result::success();
}

}  // namespace

Result apply_config_values(const std::unordered_map<std::string, std::string>& values,
                           AuditConfig& config) {
  for (const auto& [key, value] : values) {
    if (key == "data_dir") {
      config.data_dir = value;
    } else if (key == "store") {
      config.store_backend = util::lowercase_copy(value);
    } else if (key == "signing_key") {
      config.signing_key_hex = value;
    } else if (key == "encryption_key") {
      config.encryption_key_hex = value;
    } else if (key == "sensitive_fields") {
      config.sanitizer.sensitive_field_patterns = util::split_csv(value);
    } else if (key == "redaction_token") {
      config.sanitizer.redaction_token = value;
    } else if (key == "log_level") {
      config.log_level = util::lowercase_copy(value);
    } else if (key == "store_retry_attempts") {
      if (!parse_uint32(value, config.store_retry_attempts)) {
        return Result::failure("Invalid store_retry_attempts: " + value, ErrorKind::Validation);
      }
    } else if (key == "store_retry_backoff_ms") {
      if (!parse_uint32(value, config.store_retry_backoff_ms)) {
        return Result::failure("Invalid store_retry_backoff_ms: " + value,
                               ErrorKind::Validation);
      }
    }
  }
  return Result::success();
}

Result load_config_file(std::string_view path, AuditConfig& config) {
  std::ifstream in(std::string{path}, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure("Cannot read config file: " + std::string{path},
                           ErrorKind::Validation);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return apply_config_values(util::parse_key_values(buffer.str()), config);
}

void apply_env_overrides(AuditConfig& config) {
  override_from_env("SEALTRAIL_DATA_DIR", config.data_dir);
  override_from_env("SEALTRAIL_STORE", config.store_backend);
  override_from_env("SEALTRAIL_SIGNING_KEY", config.signing_key_hex);
  override_from_env("SEALTRAIL_ENCRYPTION_KEY", config.encryption_key_hex);
  override_from_env("SEALTRAIL_LOG_LEVEL", config.log_level);
}

Result validate_config(const AuditConfig& config) {
  if (config.store_backend != "file" && config.store_backend != "memory") {
    return Result::failure("Unknown store backend: " + config.store_backend,
                           ErrorKind::Validation);
  }
  if (config.store_backend == "file" && config.data_dir.empty()) {
    return Result::failure("File store requires data_dir.", ErrorKind::Validation);
  }
  if (config.store_retry_attempts == 0 || config.store_retry_attempts > 10) {
    return Result::failure("store_retry_attempts must be between 1 and 10.",
                           ErrorKind::Validation);
  }
  if (config.store_retry_backoff_ms > 10'000) {
    return Result::failure("store_retry_backoff_ms must not exceed 10000.",
                           ErrorKind::Validation);
  }
  if (config.sanitizer.redaction_token.empty()) {
    return Result::failure("redaction_token must not be empty.", ErrorKind::Validation);
  }

  const Result signing = check_key(config.signing_key_hex, "Signing key");
  if (!signing.ok) {
    return signing;
  }
  const Result encryption = check_key(config.encryption_key_hex, "Encryption key");
  if (!encryption.ok) {
    return encryption;
  }
  if (config.signing_key_hex == config.encryption_key_hex) {
    return Result::failure("Signing and encryption keys must differ.", ErrorKind::Crypto);
  }
  return Result::success();
}

}  // namespace sealtrail

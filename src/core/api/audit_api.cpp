#include "core/api/audit_api.hpp"

#include <algorithm>
#include <utility>

#include "core/audit/event_validation.hpp"
#include "core/config/config.hpp"
#include "core/model/log_codec.hpp"
#include "core/storage/file_store.hpp"
#include "core/storage/memory_store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace sealtrail {
namespace {

constexpr std::size_t kMinAccessKeyLength = 12;

// Drops empty values, mirroring optional fields the caller left out.
MetaValue text_fields(std::vector<std::pair<std::string, std::string>> values) {
  std::vector<MetaField> fields;
  for (auto& [key, value] : values) {
    if (!value.empty()) {
      fields.push_back({std::move(key), MetaValue::of(std::move(value))});
    }
  }
  return MetaValue::object(std::move(fields));
}

bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

}  // namespace

Result AuditTrail::init(const AuditConfig& config) {
  const Result valid = validate_config(config);
  if (!valid.ok) {
    return valid;
  }

  if (config.store_backend == "memory") {
    return init(config, std::make_shared<MemoryStore>());
  }

  auto file_store = std::make_shared<FileStore>();
  const Result opened = file_store->open(config.data_dir);
  if (!opened.ok) {
    logging::logger()->error("init: {}", opened.message);
    return opened;
  }
  return init(config, std::move(file_store));
}

Result AuditTrail::init(const AuditConfig& config, std::shared_ptr<AuditStore> store) {
  if (ledger_ != nullptr) {
    return Result::failure("Init failed: audit trail is already initialized.",
                           ErrorKind::Validation);
  }
  if (store == nullptr) {
    return Result::failure("Init failed: no store adapter supplied.");
  }

  const Result valid = validate_config(config);
  if (!valid.ok) {
    return valid;
  }
  config_ = config;
  logging::set_level(config_.log_level);

  const Result crypto_init = crypto_.initialize(config_.signing_key_hex,
                                                config_.encryption_key_hex);
  if (!crypto_init.ok) {
    return crypto_init;
  }

  auto ledger = std::make_unique<Ledger>(
      *store, crypto_, Sanitizer{config_.sanitizer},
      LedgerOptions{config_.store_retry_attempts, config_.store_retry_backoff_ms});
  const Result opened = ledger->open();
  if (!opened.ok) {
    return opened;
  }

  store_ = std::move(store);
  ledger_ = std::move(ledger);
  verifier_ = std::make_unique<IntegrityVerifier>(*store_, crypto_);
  return opened;
}

Result AuditTrail::not_ready() const {
  return Result::failure("Audit trail is not initialized.", ErrorKind::Validation);
}

Result AuditTrail::log_event(EventCategory category, std::string_view actor_id,
                             std::string_view resource, Outcome result, MetaValue metadata) {
  AuditEvent event;
  event.category = category;
  event.actor_id = std::string{actor_id};
  event.resource = std::string{resource};
  event.result = result;
  event.metadata = std::move(metadata);
  return log(event);
}

Result AuditTrail::log(const AuditEvent& event) {
  if (!ready()) {
    return not_ready();
  }
  const Result valid = validate_event(event);
  if (!valid.ok) {
    return valid;
  }
  return ledger_->append(with_event_defaults(event)).status;
}

Result AuditTrail::log_payment_event(const PaymentEventDraft& draft) {
  AuditEvent event;
  event.category = EventCategory::Payment;
  event.actor_id = draft.actor_id;
  event.device_id = draft.device_id;
  event.action = draft.action;
  event.resource = "payment";
  event.result = contains(draft.action, "failure") ? Outcome::Failure : Outcome::Success;
  event.network_origin = draft.network_origin;
  event.user_agent = draft.user_agent;
  event.correlation_id = draft.correlation_id;
  event.sensitive_data_accessed = true;
  event.risk_level = RiskLevel::High;
  event.compliance_tags = {ComplianceTag::PciDss};
  event.metadata = text_fields({
      {"transaction_id", draft.transaction_id},
      {"amount", draft.amount},
      {"currency", draft.currency},
      {"error_code", draft.error_code},
  });
  return log(event);
}

Result AuditTrail::log_auth_event(const AuthEventDraft& draft) {
  const bool failed = contains(draft.action, "failed");

  AuditEvent event;
  event.category = EventCategory::Auth;
  event.actor_id = draft.actor_id;
  event.action = draft.action;
  event.resource = "authentication";
  event.result = failed || contains(draft.action, "locked") ? Outcome::Failure : Outcome::Success;
  event.network_origin = draft.network_origin;
  event.user_agent = draft.user_agent;
  event.correlation_id = draft.correlation_id;
  event.risk_level = failed ? RiskLevel::High : RiskLevel::Medium;
  event.compliance_tags = {ComplianceTag::Gdpr};
  if (!draft.risk_factors.empty()) {
    std::vector<MetaValue> factors;
    for (const auto& factor : draft.risk_factors) {
      factors.push_back(MetaValue::of(factor));
    }
    event.metadata = MetaValue::object({{"risk_factors", MetaValue::list(std::move(factors))}});
  }
  return log(event);
}

Result AuditTrail::log_data_access_event(const DataAccessEventDraft& draft) {
  AuditEvent event;
  event.category = EventCategory::DataAccess;
  event.actor_id = draft.actor_id;
  event.action = draft.action;
  event.resource = "personal_data";
  event.network_origin = draft.network_origin;
  event.user_agent = draft.user_agent;
  event.correlation_id = draft.correlation_id;
  event.sensitive_data_accessed = true;
  event.risk_level = RiskLevel::High;
  event.compliance_tags = {ComplianceTag::Gdpr};
  event.metadata = text_fields({
      {"data_type", draft.data_type},
      {"legal_basis", draft.legal_basis},
  });
  return log(event);
}

Result AuditTrail::log_admin_event(const AdminEventDraft& draft) {
  AuditEvent event;
  event.category = EventCategory::Admin;
  event.actor_id = draft.actor_id;
  event.action = draft.action;
  event.resource = draft.resource;
  event.network_origin = draft.network_origin;
  event.user_agent = draft.user_agent;
  event.correlation_id = draft.correlation_id;
  event.sensitive_data_accessed = true;
  event.risk_level = RiskLevel::High;
  event.compliance_tags = {ComplianceTag::Sox};
  event.changes = draft.changes;
  return log(event);
}

Result AuditTrail::record_retention_sweep(std::string_view actor_id, std::int64_t cutoff_ms,
                                          std::string_view policy) {
  AuditEvent event;
  event.category = EventCategory::Admin;
  event.actor_id = std::string{actor_id};
  event.action = "retention_sweep";
  event.resource = "audit_log";
  event.risk_level = RiskLevel::Medium;
  event.compliance_tags = {ComplianceTag::Sox};
  event.metadata = text_fields({
      {"cutoff_ms", std::to_string(cutoff_ms)},
      {"policy", std::string{policy}},
  });
  return log(event);
}

VerificationResult AuditTrail::verify_chain(std::optional<std::uint64_t> start_block,
                                            std::optional<std::uint64_t> end_block) const {
  const auto current = tip();
  if (!current) {
    VerificationResult result;
    result.ok = false;
    result.complete = false;
    result.reason = "audit trail is not initialized";
    return result;
  }

  VerifyRequest request;
  request.start_block = start_block.value_or(1);
  request.end_block = std::min(end_block.value_or(current->block_number), current->block_number);
  return verifier_->verify(request);
}

VerificationResult AuditTrail::verify(const VerifyRequest& request) const {
  const auto current = tip();
  if (!current) {
    VerificationResult result;
    result.ok = false;
    result.complete = false;
    result.reason = "audit trail is not initialized";
    return result;
  }

  VerifyRequest clamped = request;
  clamped.end_block = std::min(request.end_block, current->block_number);
  return verifier_->verify(clamped);
}

ExportResult AuditTrail::export_range(std::uint64_t start_block, std::uint64_t end_block,
                                      std::string_view access_key) const {
  ExportResult out;
  const auto current = tip();
  if (!current) {
    out.status = not_ready();
    return out;
  }
  if (access_key.size() < kMinAccessKeyLength) {
    out.status = Result::failure("Export access key must be at least 12 characters.",
                                 ErrorKind::Validation);
    return out;
  }
  if (start_block == 0 || end_block < start_block || end_block > current->block_number) {
    out.status = Result::failure("Export range is outside the chain (tip " +
                                     std::to_string(current->block_number) + ").",
                                 ErrorKind::Validation);
    return out;
  }

  // The whole prefix is verified so the first exported entry is anchored at genesis.
  out.verification = verify_chain(1, end_block);
  if (!out.verification.ok || !out.verification.complete) {
    out.status = Result::failure("Export refused: chain failed verification (" +
                                     out.verification.reason + ").",
                                 ErrorKind::Validation);
    return out;
  }

  std::vector<ExportedEntry> entries;
  bool decrypt_failed = false;
  const Result streamed = store_->query_range(start_block, end_block,
                                              [&](const SealedEntry& sealed) {
    auto plain = crypto_.decrypt(sealed.encrypted_log);
    auto log = plain ? decode_log(*plain) : std::nullopt;
    if (!log) {
      decrypt_failed = true;
      return false;
    }
    ExportedEntry exported;
    exported.entry.id = sealed.id;
    exported.entry.log = std::move(*log);
    exported.entry.block_number = sealed.block_number;
    exported.entry.previous_hash = sealed.previous_hash;
    exported.entry.hash = sealed.hash;
    exported.entry.signature = sealed.signature;
    exported.entry.created_at_ms = sealed.created_at_ms;
    exported.canonical_log = std::move(*plain);
    entries.push_back(std::move(exported));
    return true;
  });
  if (!streamed.ok) {
    out.status = streamed;
    return out;
  }
  if (decrypt_failed) {
    out.status = Result::failure("Export failed: entry could not be decoded.", ErrorKind::Crypto);
    return out;
  }

  auto ciphertext =
      CryptoEngine::encrypt_with_passphrase(encode_bundle_entries(entries), access_key);
  if (!ciphertext) {
    out.status = Result::failure("Export failed: bundle encryption failed.", ErrorKind::Crypto);
    return out;
  }

  EncryptedBundle bundle;
  bundle.start_block = start_block;
  bundle.end_block = end_block;
  bundle.entry_count = entries.size();
  bundle.last_hash = entries.empty() ? std::string{} : entries.back().entry.hash;
  bundle.created_at_ms = util::unix_millis_now();
  bundle.ciphertext = std::move(*ciphertext);
  out.bundle = std::move(bundle);

  logging::logger()->info("exported blocks {}..{} ({} entries)", start_block, end_block,
                          entries.size());
  out.status = Result::success("Export bundle created.");
  return out;
}

Result AuditTrail::open_export_bundle(const EncryptedBundle& bundle, std::string_view access_key,
                                      std::vector<SecureAuditEntry>& out) {
  out.clear();
  const auto payload = CryptoEngine::decrypt_with_passphrase(bundle.ciphertext, access_key);
  if (!payload) {
    return Result::failure("Bundle could not be decrypted with this access key.",
                           ErrorKind::Crypto);
  }

  auto entries = decode_bundle_entries(*payload);
  if (!entries || entries->size() != bundle.entry_count) {
    return Result::failure("Bundle payload is malformed.", ErrorKind::Validation);
  }

  std::uint64_t expected_block = bundle.start_block;
  const std::string* previous = nullptr;
  for (const auto& exported : *entries) {
    const SecureAuditEntry& entry = exported.entry;
    if (entry.block_number != expected_block ||
        (previous != nullptr && entry.previous_hash != *previous) ||
        util::chain_hash(exported.canonical_log, entry.previous_hash) != entry.hash) {
      return Result::failure("Bundle chain is broken at block " +
                                 std::to_string(entry.block_number) + ".",
                             ErrorKind::Validation);
    }
    previous = &entry.hash;
    ++expected_block;
  }
  if (!entries->empty() && entries->back().entry.hash != bundle.last_hash) {
    return Result::failure("Bundle header does not match its last entry.",
                           ErrorKind::Validation);
  }

  for (auto& exported : *entries) {
    out.push_back(std::move(exported.entry));
  }
  return Result::success("Bundle opened.", std::to_string(out.size()));
}

ComplianceReport AuditTrail::compliance_report(ComplianceTag tag, std::int64_t from_ms,
                                               std::int64_t to_ms) const {
  if (!ready()) {
    ComplianceReport empty;
    empty.tag = tag;
    empty.from_ms = from_ms;
    empty.to_ms = to_ms;
    return empty;
  }
  const VerificationResult integrity = verify_chain();
  return generate_compliance_report(*store_, crypto_, tag, from_ms, to_ms,
                                    integrity.ok && integrity.complete);
}

std::optional<ChainTip> AuditTrail::tip() const {
  if (ledger_ == nullptr) {
    return std::nullopt;
  }
  return ledger_->tip();
}

}  // namespace sealtrail

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/export_bundle.hpp"
#include "core/chain/ledger.hpp"
#include "core/chain/verifier.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/report/compliance_report.hpp"
#include "core/storage/store.hpp"

namespace sealtrail {

struct PaymentEventDraft {
  std::string actor_id;
  std::string device_id;
  // payment_attempt, payment_success, payment_failure, refund
  std::string action;
  std::string transaction_id;
  std::string amount;
  std::string currency;
  std::string error_code;
  std::string network_origin;
  std::string user_agent;
  std::string correlation_id;
};

struct AuthEventDraft {
  std::string actor_id;
  // login, logout, failed_login, password_change, account_locked
  std::string action;
  std::vector<std::string> risk_factors;
  std::string network_origin;
  std::string user_agent;
  std::string correlation_id;
};

struct DataAccessEventDraft {
  std::string actor_id;
  // data_access, data_export, data_deletion, consent_update
  std::string action;
  std::string data_type;
  std::string legal_basis;
  std::string network_origin;
  std::string user_agent;
  std::string correlation_id;
};

struct AdminEventDraft {
  std::string actor_id;
  // config_change, user_privilege_change, system_access, data_backup
  std::string action;
  std::string resource;
  std::optional<ChangeSnapshot> changes;
  std::string network_origin;
  std::string user_agent;
  std::string correlation_id;
};

struct ExportResult {
  Result status;
  VerificationResult verification;
  std::optional<EncryptedBundle> bundle;
};

// Caller-facing entry point. One instance per chain; no process-wide state. Errors come
// back as Result values and integrity findings as VerificationResult, never as exceptions.
class AuditTrail {
public:
  AuditTrail() = default;
  AuditTrail(const AuditTrail&) = delete;
  AuditTrail& operator=(const AuditTrail&) = delete;

  // Builds the store named by config.store_backend.
  Result init(const AuditConfig& config);
  // Uses a host-provided store adapter instead.
  Result init(const AuditConfig& config, std::shared_ptr<AuditStore> store);

  [[nodiscard]] bool ready() const { return ledger_ != nullptr && ledger_->ready(); }

  // Result::data carries the new entry id.
  Result log_event(EventCategory category, std::string_view actor_id, std::string_view resource,
                   Outcome result, MetaValue metadata);
  Result log(const AuditEvent& event);

  Result log_payment_event(const PaymentEventDraft& draft);
  Result log_auth_event(const AuthEventDraft& draft);
  Result log_data_access_event(const DataAccessEventDraft& draft);
  Result log_admin_event(const AdminEventDraft& draft);
  // Retention never deletes entries; the sweep itself becomes an Admin entry.
  Result record_retention_sweep(std::string_view actor_id, std::int64_t cutoff_ms,
                                std::string_view policy);

  // Defaults to 1..tip; end is clamped to the tip.
  [[nodiscard]] VerificationResult verify_chain(std::optional<std::uint64_t> start_block = {},
                                                std::optional<std::uint64_t> end_block = {}) const;
  [[nodiscard]] VerificationResult verify(const VerifyRequest& request) const;

  ExportResult export_range(std::uint64_t start_block, std::uint64_t end_block,
                            std::string_view access_key) const;
  static Result open_export_bundle(const EncryptedBundle& bundle, std::string_view access_key,
                                   std::vector<SecureAuditEntry>& out);

  [[nodiscard]] ComplianceReport compliance_report(ComplianceTag tag, std::int64_t from_ms,
                                                   std::int64_t to_ms) const;

  [[nodiscard]] std::optional<ChainTip> tip() const;

private:
  Result not_ready() const;

  AuditConfig config_{};
  CryptoEngine crypto_;
  std::shared_ptr<AuditStore> store_;
  std::unique_ptr<Ledger> ledger_;
  std::unique_ptr<IntegrityVerifier> verifier_;
};

}  // namespace sealtrail

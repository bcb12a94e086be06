#include "core/chain/ledger.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include "core/audit/event_validation.hpp"
#include "core/model/log_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace sealtrail {
namespace {

AppendResult append_failure(Result status) {
  return AppendResult{std::move(status), std::nullopt};
}

}  // namespace

Ledger::Ledger(AuditStore& store, const CryptoEngine& crypto, Sanitizer sanitizer,
               LedgerOptions options)
    : store_(store), crypto_(crypto), sanitizer_(std::move(sanitizer)), options_(options) {}

Result Ledger::open() {
  std::lock_guard lock(mutex_);
  if (!crypto_.ready()) {
    return Result::failure("Ledger requires an initialized crypto engine.", ErrorKind::Crypto);
  }

  const Result initialized = state_.initialize(store_.last_block());
  if (!initialized.ok) {
    logging::logger()->error("ledger open failed: {}", initialized.message);
    return initialized;
  }

  logging::logger()->info("ledger open at block {}", state_.block_number());
  return initialized;
}

AppendResult Ledger::append(const AuditEvent& event) {
  const Result valid = validate_event(event);
  if (!valid.ok) {
    return append_failure(valid);
  }

  std::lock_guard lock(mutex_);
  if (!state_.ready()) {
    return append_failure(Result::failure("Ledger is not open.", ErrorKind::Store));
  }

  SecureAuditEntry entry;
  entry.log.event = sanitizer_.sanitize(event);
  entry.log.timestamp_ms = util::unix_millis_now();
  entry.created_at_ms = entry.log.timestamp_ms;
  entry.block_number = state_.block_number() + 1;
  entry.previous_hash = state_.last_hash();
  entry.id = CryptoEngine::random_id();

  const std::string canonical = encode_log(entry.log);
  entry.hash = util::chain_hash(canonical, entry.previous_hash);
  entry.signature = crypto_.sign(canonical, entry.hash);
  if (entry.signature.empty()) {
    logging::logger()->error("block {}: signing failed, entry not persisted", entry.block_number);
    return append_failure(
        Result::failure("Failed to sign audit entry.", ErrorKind::Crypto));
  }

  auto encrypted = crypto_.encrypt(canonical);
  if (!encrypted) {
    logging::logger()->error("block {}: encryption failed, entry not persisted",
                             entry.block_number);
    return append_failure(
        Result::failure("Failed to encrypt audit entry.", ErrorKind::Crypto));
  }

  SealedEntry sealed;
  sealed.id = entry.id;
  sealed.encrypted_log = std::move(*encrypted);
  sealed.block_number = entry.block_number;
  sealed.previous_hash = entry.previous_hash;
  sealed.hash = entry.hash;
  sealed.signature = entry.signature;
  sealed.created_at_ms = entry.created_at_ms;
  sealed.compliance_tags = entry.log.event.compliance_tags;

  const Result persisted = persist_with_retry(sealed);
  if (!persisted.ok) {
    logging::logger()->error("block {}: store insert failed: {}", sealed.block_number,
                             persisted.message);
    return append_failure(persisted);
  }

  state_.advance(entry.hash, entry.block_number);
  logging::logger()->info("block {} appended ({} / {})", entry.block_number,
                          to_string(entry.log.event.category), entry.log.event.action);
  return AppendResult{Result::success("Audit entry appended.", entry.id), std::move(entry)};
}

bool Ledger::ready() const {
  std::lock_guard lock(mutex_);
  return state_.ready();
}

std::optional<ChainTip> Ledger::tip() const {
  std::lock_guard lock(mutex_);
  if (!state_.ready()) {
    return std::nullopt;
  }
  return state_.tip();
}

Result Ledger::persist_with_retry(const SealedEntry& sealed) {
  const std::uint32_t attempts = std::max<std::uint32_t>(1, options_.store_retry_attempts);
  std::uint32_t backoff_ms = options_.store_retry_backoff_ms;
  Result last = Result::failure("Store insert was not attempted.");

  for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    last = store_.insert(sealed);
    if (last.ok) {
      return last;
    }

    // A failed insert may still have landed (timeout after write); the stored tip decides.
    const auto stored = store_.last_block();
    if (stored && stored->block_number == sealed.block_number && stored->hash == sealed.hash) {
      logging::logger()->warn("block {}: insert reported failure but entry is persisted",
                              sealed.block_number);
      return Result::success("Audit entry persisted.");
    }

    if (attempt < attempts) {
      logging::logger()->warn("block {}: insert attempt {}/{} failed: {}", sealed.block_number,
                              attempt, attempts, last.message);
      std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
      backoff_ms *= 2;
    }
  }

  last.kind = ErrorKind::Store;
  return last;
}

}  // namespace sealtrail

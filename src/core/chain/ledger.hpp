#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "core/audit/sanitizer.hpp"
#include "core/chain/chain_state.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace sealtrail {

struct LedgerOptions {
  std::uint32_t store_retry_attempts = 3;
  std::uint32_t store_retry_backoff_ms = 25;
};

struct AppendResult {
  Result status;
  std::optional<SecureAuditEntry> entry;
};

// Single writer for the chain. Every append runs sanitize -> hash -> sign -> encrypt ->
// insert -> advance under one mutex, so block numbers are strictly contiguous and each
// entry links to the hash of the entry persisted immediately before it.
class Ledger {
public:
  Ledger(AuditStore& store, const CryptoEngine& crypto, Sanitizer sanitizer,
         LedgerOptions options = {});

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;

  // Reads the persisted tip once. Must succeed before append is accepted.
  Result open();

  // Never throws. On any failure the chain state is left untouched.
  AppendResult append(const AuditEvent& event);

  [[nodiscard]] bool ready() const;
  [[nodiscard]] std::optional<ChainTip> tip() const;

private:
  Result persist_with_retry(const SealedEntry& sealed);

  AuditStore& store_;
  const CryptoEngine& crypto_;
  Sanitizer sanitizer_;
  LedgerOptions options_;

  mutable std::mutex mutex_;
  ChainState state_;
};

}  // namespace sealtrail

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "core/crypto/crypto.hpp"
#include "core/storage/store.hpp"

namespace sealtrail {

struct VerifyRequest {
  std::uint64_t start_block = 1;
  std::uint64_t end_block = std::numeric_limits<std::uint64_t>::max();
  // Trusted hash of block start_block - 1. Without it the first entry of a sub-range is not
  // linked to history; checks start at that entry.
  std::optional<std::string> expected_previous_hash;
  // 0 means unbounded.
  std::size_t max_entries = 0;
  const std::atomic<bool>* stop = nullptr;
};

struct VerificationResult {
  bool ok = true;
  std::optional<std::uint64_t> broken_at_block;
  std::string reason;
  std::size_t entries_checked = 0;
  std::uint64_t last_verified_block = 0;
  std::string last_verified_hash;
  // False when the scan was cancelled or capped before reaching end_block.
  bool complete = true;
};

// Read-only replay of the chain: contiguity, linkage, decryption, recomputed hash and
// signature for each entry, stopping at the first break.
class IntegrityVerifier {
public:
  IntegrityVerifier(const AuditStore& store, const CryptoEngine& crypto);

  [[nodiscard]] VerificationResult verify(const VerifyRequest& request) const;

private:
  [[nodiscard]] static std::optional<std::string> anchor_hash(const VerifyRequest& request);

  const AuditStore& store_;
  const CryptoEngine& crypto_;
};

}  // namespace sealtrail

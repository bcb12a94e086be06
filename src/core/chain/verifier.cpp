#include "core/chain/verifier.hpp"

#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace sealtrail {
namespace {

void mark_broken(VerificationResult& result, std::uint64_t block, std::string reason) {
  result.ok = false;
  result.broken_at_block = block;
  result.reason = std::move(reason);
}

}  // namespace

IntegrityVerifier::IntegrityVerifier(const AuditStore& store, const CryptoEngine& crypto)
    : store_(store), crypto_(crypto) {}

std::optional<std::string> IntegrityVerifier::anchor_hash(const VerifyRequest& request) {
  if (request.expected_previous_hash) {
    return request.expected_previous_hash;
  }
  if (request.start_block <= 1) {
    return std::string{kGenesisHash};
  }
  return std::nullopt;
}

VerificationResult IntegrityVerifier::verify(const VerifyRequest& request) const {
  VerificationResult result;
  const std::uint64_t start = request.start_block == 0 ? 1 : request.start_block;
  result.last_verified_block = start - 1;

  if (!crypto_.ready()) {
    result.ok = false;
    result.complete = false;
    result.reason = "crypto engine is not initialized";
    return result;
  }
  if (request.end_block < start) {
    return result;
  }

  VerifyRequest anchored = request;
  anchored.start_block = start;
  std::optional<std::string> expected_previous = anchor_hash(anchored);
  if (expected_previous) {
    result.last_verified_hash = *expected_previous;
  }

  std::uint64_t next_block = start;
  bool stopped_early = false;

  const Result streamed = store_.query_range(
      start, request.end_block, [&](const SealedEntry& entry) {
        if (request.stop != nullptr && request.stop->load()) {
          stopped_early = true;
          return false;
        }
        if (request.max_entries > 0 && result.entries_checked >= request.max_entries) {
          stopped_early = true;
          return false;
        }

        if (entry.block_number < next_block) {
          mark_broken(result, entry.block_number, "duplicate block number");
          return false;
        }
        if (entry.block_number > next_block) {
          mark_broken(result, next_block, "missing block");
          return false;
        }
        if (expected_previous && entry.previous_hash != *expected_previous) {
          mark_broken(result, entry.block_number, "previous hash does not match prior entry");
          return false;
        }

        const auto plain = crypto_.decrypt(entry.encrypted_log);
        if (!plain) {
          mark_broken(result, entry.block_number, "log body failed authenticated decryption");
          return false;
        }
        if (util::chain_hash(*plain, entry.previous_hash) != entry.hash) {
          mark_broken(result, entry.block_number, "hash does not match log content");
          return false;
        }
        if (!crypto_.verify_signature(*plain, entry.hash, entry.signature)) {
          mark_broken(result, entry.block_number, "signature does not match");
          return false;
        }

        ++result.entries_checked;
        result.last_verified_block = entry.block_number;
        result.last_verified_hash = entry.hash;
        expected_previous = entry.hash;
        ++next_block;
        return true;
      });

  if (!streamed.ok) {
    result.ok = false;
    result.complete = false;
    result.reason = "store query failed: " + streamed.message;
    logging::logger()->error("verification aborted: {}", streamed.message);
    return result;
  }

  if (result.ok && !stopped_early && next_block <= request.end_block &&
      request.end_block != std::numeric_limits<std::uint64_t>::max()) {
    mark_broken(result, next_block, "missing block");
  }

  if (!result.ok) {
    result.complete = false;
    logging::logger()->critical("integrity violation at block {}: {}", *result.broken_at_block,
                                result.reason);
    return result;
  }

  result.complete = !stopped_early;
  if (result.complete) {
    logging::logger()->info("verified blocks {}..{} ({} entries)", start,
                            result.last_verified_block, result.entries_checked);
  } else {
    logging::logger()->info("verification paused after block {} ({} entries)",
                            result.last_verified_block, result.entries_checked);
  }
  return result;
}

}  // namespace sealtrail

#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "core/model/types.hpp"

namespace sealtrail {

// Append-only persistence consumed by the ledger and the verifier.
class AuditStore {
public:
  // Return false to stop the stream early.
  using EntryVisitor = std::function<bool(const SealedEntry&)>;

  virtual ~AuditStore() = default;

  // Fails (ErrorKind::Store) unless entry.block_number is exactly last + 1.
  virtual Result insert(const SealedEntry& entry) = 0;

  // Visits stored entries with start_block <= block_number <= end_block in ascending order.
  // The visited set is a snapshot taken when the call starts.
  virtual Result query_range(std::uint64_t start_block, std::uint64_t end_block,
                             const EntryVisitor& visitor) const = 0;

  [[nodiscard]] virtual std::optional<ChainTip> last_block() const = 0;
};

}  // namespace sealtrail

#pragma once

#include <cstddef>
#include <shared_mutex>
#include <vector>

#include "core/storage/store.hpp"

namespace sealtrail {

class MemoryStore : public AuditStore {
public:
  Result insert(const SealedEntry& entry) override;
  Result query_range(std::uint64_t start_block, std::uint64_t end_block,
                     const EntryVisitor& visitor) const override;
  [[nodiscard]] std::optional<ChainTip> last_block() const override;

  [[nodiscard]] std::size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::vector<SealedEntry> entries_;
};

}  // namespace sealtrail

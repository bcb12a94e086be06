#include "core/storage/memory_store.hpp"

#include <mutex>
#include <string>

namespace sealtrail {

Result MemoryStore::insert(const SealedEntry& entry) {
  std::unique_lock lock(mutex_);
  const std::uint64_t expected = entries_.empty() ? 1 : entries_.back().block_number + 1;
  if (entry.block_number != expected) {
    return Result::failure("insert rejected: block " + std::to_string(entry.block_number) +
                           " is not the next block (" + std::to_string(expected) + ").");
  }
  entries_.push_back(entry);
  return Result::success();
}

Result MemoryStore::query_range(std::uint64_t start_block, std::uint64_t end_block,
                                const EntryVisitor& visitor) const {
  std::vector<SealedEntry> snapshot;
  {
    std::shared_lock lock(mutex_);
    for (const auto& entry : entries_) {
      if (entry.block_number >= start_block && entry.block_number <= end_block) {
        snapshot.push_back(entry);
      }
    }
  }

  for (const auto& entry : snapshot) {
    if (!visitor(entry)) {
      break;
    }
  }
  return Result::success();
}

std::optional<ChainTip> MemoryStore::last_block() const {
  std::shared_lock lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return ChainTip{entries_.back().block_number, entries_.back().hash};
}

std::size_t MemoryStore::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

}  // namespace sealtrail

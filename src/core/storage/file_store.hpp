#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/storage/store.hpp"

namespace sealtrail {

// Append-only chain file (audit-chain.dat) under a data directory. The whole chain is
// loaded on open; inserts append one line and flush before the in-memory view changes.
class FileStore : public AuditStore {
public:
  Result open(std::string_view data_dir);

  Result insert(const SealedEntry& entry) override;
  Result query_range(std::uint64_t start_block, std::uint64_t end_block,
                     const EntryVisitor& visitor) const override;
  [[nodiscard]] std::optional<ChainTip> last_block() const override;

  [[nodiscard]] const std::string& path() const { return chain_path_; }
  [[nodiscard]] std::size_t entry_count() const;
  [[nodiscard]] std::size_t parse_error_count() const;

  static std::string serialize_entry_line(const SealedEntry& entry);
  static bool parse_entry_line(std::string_view line, SealedEntry& out);

private:
  Result load_chain_file();
  Result ensure_header() const;

  mutable std::mutex mutex_;
  std::string data_dir_;
  std::string chain_path_;
  std::vector<SealedEntry> entries_;
  std::size_t parse_errors_ = 0;
  bool opened_ = false;
};

}  // namespace sealtrail

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace sealtrail {

// Archival copy of a verified block range, sealed with a passphrase-derived key so it can
// be handed to an auditor without the chain's own keys. Header fields are in clear.
struct EncryptedBundle {
  std::uint64_t start_block = 0;
  std::uint64_t end_block = 0;
  std::size_t entry_count = 0;
  std::string last_hash;
  std::int64_t created_at_ms = 0;
  std::string ciphertext;
};

// One exported block: the entry plus the exact canonical log bytes its hash covers.
struct ExportedEntry {
  SecureAuditEntry entry;
  std::string canonical_log;
};

std::string encode_bundle_entries(const std::vector<ExportedEntry>& entries);
std::optional<std::vector<ExportedEntry>> decode_bundle_entries(std::string_view payload);

// Text form used by `sealtrail export`.
std::string serialize_bundle(const EncryptedBundle& bundle);
std::optional<EncryptedBundle> parse_bundle(std::string_view text);

}  // namespace sealtrail

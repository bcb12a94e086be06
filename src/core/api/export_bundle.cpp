#include "core/api/export_bundle.hpp"

#include <charconv>
#include <cstdio>
#include <system_error>
#include <utility>

#include "core/model/log_codec.hpp"
#include "core/util/canonical.hpp"

namespace sealtrail {
namespace {

constexpr std::string_view kBundleFormat = "sealtrail-export-v1";

template <typename Int>
bool parse_number(std::string_view text, Int& out) {
  Int value{};
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

std::string entry_key(std::size_t index) {
  char buffer[24];
  std::snprintf(buffer, sizeof(buffer), "entry.%08zu", index);
  return buffer;
}

std::string encode_entry(const ExportedEntry& exported) {
  const SecureAuditEntry& entry = exported.entry;
  return util::canonical_join({
      {"id", entry.id},
      {"block_number", std::to_string(entry.block_number)},
      {"previous_hash", entry.previous_hash},
      {"hash", entry.hash},
      {"signature", entry.signature},
      {"created_at_ms", std::to_string(entry.created_at_ms)},
      {"log", util::to_hex(exported.canonical_log)},
  });
}

std::optional<ExportedEntry> decode_entry(std::string_view encoded) {
  const auto fields = util::parse_canonical_map(encoded);
  const auto field = [&fields](const char* key) -> std::string_view {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string_view{} : std::string_view{it->second};
  };

  ExportedEntry exported;
  exported.canonical_log = util::from_hex(field("log"));
  SecureAuditEntry& entry = exported.entry;
  entry.id = std::string{field("id")};
  entry.previous_hash = std::string{field("previous_hash")};
  entry.hash = std::string{field("hash")};
  entry.signature = std::string{field("signature")};
  if (!parse_number(field("block_number"), entry.block_number) ||
      !parse_number(field("created_at_ms"), entry.created_at_ms)) {
    return std::nullopt;
  }

  auto log = decode_log(exported.canonical_log);
  if (!log) {
    return std::nullopt;
  }
  entry.log = std::move(*log);
  return exported;
}

}  // namespace

std::string encode_bundle_entries(const std::vector<ExportedEntry>& entries) {
  std::vector<std::pair<std::string, std::string>> fields;
  fields.reserve(entries.size() + 2U);
  fields.emplace_back("format", std::string{kBundleFormat});
  fields.emplace_back("count", std::to_string(entries.size()));
  for (std::size_t i = 0; i < entries.size(); ++i) {
    fields.emplace_back(entry_key(i), util::to_hex(encode_entry(entries[i])));
  }
  return util::canonical_join(std::move(fields));
}

std::optional<std::vector<ExportedEntry>> decode_bundle_entries(std::string_view payload) {
  const auto fields = util::parse_canonical_map(payload);
  const auto format = fields.find("format");
  const auto count_it = fields.find("count");
  if (format == fields.end() || format->second != kBundleFormat || count_it == fields.end()) {
    return std::nullopt;
  }

  std::size_t count = 0;
  if (!parse_number(std::string_view{count_it->second}, count)) {
    return std::nullopt;
  }

  std::vector<ExportedEntry> entries;
  entries.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto it = fields.find(entry_key(i));
    if (it == fields.end()) {
      return std::nullopt;
    }
    auto entry = decode_entry(util::from_hex(it->second));
    if (!entry) {
      return std::nullopt;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::string serialize_bundle(const EncryptedBundle& bundle) {
  return util::canonical_join({
      {"format", std::string{kBundleFormat}},
      {"start_block", std::to_string(bundle.start_block)},
      {"end_block", std::to_string(bundle.end_block)},
      {"entry_count", std::to_string(bundle.entry_count)},
      {"last_hash", bundle.last_hash},
      {"created_at_ms", std::to_string(bundle.created_at_ms)},
      {"ciphertext", util::to_hex(bundle.ciphertext)},
  });
}

std::optional<EncryptedBundle> parse_bundle(std::string_view text) {
  auto fields = util::parse_canonical_map(text);
  if (fields["format"] != kBundleFormat) {
    return std::nullopt;
  }

  EncryptedBundle bundle;
  if (!parse_number(std::string_view{fields["start_block"]}, bundle.start_block) ||
      !parse_number(std::string_view{fields["end_block"]}, bundle.end_block) ||
      !parse_number(std::string_view{fields["entry_count"]}, bundle.entry_count) ||
      !parse_number(std::string_view{fields["created_at_ms"]}, bundle.created_at_ms)) {
    return std::nullopt;
  }
  bundle.last_hash = fields["last_hash"];
  bundle.ciphertext = util::from_hex(fields["ciphertext"]);
  if (bundle.ciphertext.empty()) {
    return std::nullopt;
  }
  return bundle;
}

}  // namespace sealtrail

#include "core/storage/file_store.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "core/model/app_meta.hpp"
#include "core/model/log_codec.hpp"
#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace sealtrail {
namespace {

constexpr std::string_view kChainFile = "audit-chain.dat";
constexpr std::string_view kChainHeaderPrefix = "# sealtrail chain";
constexpr std::size_t kFieldCount = 8;

bool parse_uint64(std::string_view text, std::uint64_t& out) {
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

bool parse_int64(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace

std::string FileStore::serialize_entry_line(const SealedEntry& entry) {
  std::ostringstream out;
  out << entry.block_number << '\t' << entry.id << '\t' << entry.created_at_ms << '\t'
      << entry.previous_hash << '\t' << entry.hash << '\t' << entry.signature << '\t'
      << encode_tags(entry.compliance_tags) << '\t' << util::to_hex(entry.encrypted_log) << '\n';
  return out.str();
}

bool FileStore::parse_entry_line(std::string_view line, SealedEntry& out) {
  std::array<std::string_view, kFieldCount> fields{};
  std::size_t field_index = 0;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      if (field_index >= fields.size()) {
        return false;
      }
      fields[field_index++] = line.substr(start, i - start);
      start = i + 1U;
    }
  }

  if (field_index != fields.size()) {
    return false;
  }

  if (!parse_uint64(fields[0], out.block_number)) {
    return false;
  }
  out.id = std::string{fields[1]};
  if (!parse_int64(fields[2], out.created_at_ms)) {
    return false;
  }
  out.previous_hash = std::string{fields[3]};
  out.hash = std::string{fields[4]};
  out.signature = std::string{fields[5]};
  out.compliance_tags = decode_tags(fields[6]);
  out.encrypted_log = util::from_hex(fields[7]);
  return !out.encrypted_log.empty();
}

Result FileStore::open(std::string_view data_dir) {
  std::lock_guard lock(mutex_);
  data_dir_ = std::string{data_dir};
  opened_ = false;

  if (data_dir_.empty()) {
    return Result::failure("File store requires a data directory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure("Failed to create store directory: " + ec.message());
  }

  chain_path_ = (std::filesystem::path{data_dir_} / std::string{kChainFile}).string();

  const Result loaded = load_chain_file();
  if (!loaded.ok) {
    return loaded;
  }

  const Result header = ensure_header();
  if (!header.ok) {
    return header;
  }

  opened_ = true;
  return Result::success("Chain file opened.", chain_path_);
}

Result FileStore::insert(const SealedEntry& entry) {
  std::lock_guard lock(mutex_);
  if (!opened_) {
    return Result::failure("File store is not open.");
  }

  const std::uint64_t expected = entries_.empty() ? 1 : entries_.back().block_number + 1;
  if (entry.block_number != expected) {
    return Result::failure("insert rejected: block " + std::to_string(entry.block_number) +
                           " is not the next block (" + std::to_string(expected) + ").");
  }

  std::error_code ec;
  const auto size_before = std::filesystem::file_size(chain_path_, ec);
  if (ec) {
    return Result::failure("Failed to stat chain file: " + ec.message());
  }

  bool written = false;
  {
    std::ofstream out(chain_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (out) {
      out << serialize_entry_line(entry);
      out.flush();
      written = out.good();
    }
  }
  if (!written) {
    // A partial line would glue itself to the next append.
    std::filesystem::resize_file(chain_path_, size_before, ec);
    if (ec) {
      logging::logger()->error("chain file {}: rollback after failed append failed: {}",
                               chain_path_, ec.message());
    }
    return Result::failure("Failed to append to chain file.");
  }

  entries_.push_back(entry);
  return Result::success();
}

Result FileStore::query_range(std::uint64_t start_block, std::uint64_t end_block,
                              const EntryVisitor& visitor) const {
  std::vector<SealedEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    if (!opened_) {
      return Result::failure("File store is not open.");
    }
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

std::optional<ChainTip> FileStore::last_block() const {
  std::lock_guard lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return ChainTip{entries_.back().block_number, entries_.back().hash};
}

std::size_t FileStore::entry_count() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::size_t FileStore::parse_error_count() const {
  std::lock_guard lock(mutex_);
  return parse_errors_;
}

Result FileStore::load_chain_file() {
  entries_.clear();
  parse_errors_ = 0;

  std::string content;
  {
    std::ifstream in(chain_path_, std::ios::in | std::ios::binary);
    if (!in) {
      return Result::success("Chain file will be created on first write.");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
  }

  // An unterminated last line is an append torn by a crash; it was never acknowledged.
  if (!content.empty() && content.back() != '\n') {
    const auto last_newline = content.rfind('\n');
    const std::size_t keep = last_newline == std::string::npos ? 0 : last_newline + 1U;
    std::error_code ec;
    std::filesystem::resize_file(chain_path_, keep, ec);
    if (ec) {
      return Result::failure("Failed to truncate torn chain file tail: " + ec.message());
    }
    logging::logger()->warn("chain file {}: dropped {} byte(s) of torn tail", chain_path_,
                            content.size() - keep);
    content.resize(keep);
  }

  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.front() == '#') {
      if (line.rfind(std::string{kChainHeaderPrefix}, 0) == 0 &&
          line.find("version=" + std::to_string(kChainFormatVersion)) == std::string::npos) {
        return Result::failure("Unsupported chain file version: " + line);
      }
      continue;
    }

    SealedEntry entry;
    if (parse_entry_line(line, entry)) {
      entries_.push_back(std::move(entry));
    } else {
      ++parse_errors_;
    }
  }

  // Keep file order for equal block numbers so duplicates stay visible to the verifier.
  std::ranges::stable_sort(entries_, [](const SealedEntry& lhs, const SealedEntry& rhs) {
    return lhs.block_number < rhs.block_number;
  });

  if (parse_errors_ > 0) {
    logging::logger()->error("chain file {}: skipped {} unparsable line(s)", chain_path_,
                             parse_errors_);
  }
  return Result::success("Chain file loaded.");
}

Result FileStore::ensure_header() const {
  std::error_code ec;
  if (std::filesystem::exists(chain_path_, ec) && std::filesystem::file_size(chain_path_, ec) > 0) {
    return Result::success();
  }

  std::ofstream out(chain_path_, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    return Result::failure("Failed to create chain file.");
  }
  out << kChainHeaderPrefix << " version=" << kChainFormatVersion << '\n';
  if (!out.good()) {
    return Result::failure("Failed writing chain file header.");
  }
  return Result::success();
}

}  // namespace sealtrail

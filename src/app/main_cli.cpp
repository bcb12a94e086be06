#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "core/api/audit_api.hpp"
#include "core/config/config.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/log_codec.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitIntegrityBreak = 2;

template <typename Int>
std::optional<Int> parse_number(std::string_view text) {
  Int value{};
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

void print_usage() {
  std::cerr << sealtrail::kAppDisplayName << ' ' << sealtrail::kAppVersion << " ("
            << sealtrail::kBuildRelease << ")\n"
            << "usage: sealtrail [--config <file>] <command>\n"
            << "  keygen                         print a fresh 32-byte hex key\n"
            << "  tip                            print the last block number and hash\n"
            << "  verify [start] [end]           verify the chain (default: whole chain)\n"
            << "  report <tag> [from_ms] [to_ms] compliance summary for one tag\n"
            << "  export <start> <end> <file>    write an encrypted bundle "
               "(key from SEALTRAIL_EXPORT_KEY)\n";
}

void print_verification(const sealtrail::VerificationResult& result) {
  if (result.ok) {
    std::cout << (result.complete ? "OK" : "PARTIAL") << " entries=" << result.entries_checked
              << " last_block=" << result.last_verified_block
              << " last_hash=" << result.last_verified_hash << '\n';
    return;
  }
  if (result.broken_at_block) {
    std::cout << "BROKEN at block " << *result.broken_at_block << ": " << result.reason << '\n';
  } else {
    std::cout << "FAILED: " << result.reason << '\n';
  }
}

int run_verify(const sealtrail::AuditTrail& trail, const std::vector<std::string_view>& args) {
  std::optional<std::uint64_t> start;
  std::optional<std::uint64_t> end;
  if (args.size() > 1) {
    start = parse_number<std::uint64_t>(args[1]);
    if (!start) {
      std::cerr << "invalid start block: " << args[1] << '\n';
      return kExitFailure;
    }
  }
  if (args.size() > 2) {
    end = parse_number<std::uint64_t>(args[2]);
    if (!end) {
      std::cerr << "invalid end block: " << args[2] << '\n';
      return kExitFailure;
    }
  }

  const auto result = trail.verify_chain(start, end);
  print_verification(result);
  if (result.broken_at_block) {
    return kExitIntegrityBreak;
  }
  return result.ok ? kExitOk : kExitFailure;
}

int run_report(const sealtrail::AuditTrail& trail, const std::vector<std::string_view>& args) {
  if (args.size() < 2) {
    print_usage();
    return kExitFailure;
  }
  const auto tag = sealtrail::compliance_tag_from_string(args[1]);
  if (!tag) {
    std::cerr << "unknown compliance tag: " << args[1] << '\n';
    return kExitFailure;
  }

  std::int64_t from_ms = 0;
  std::int64_t to_ms = std::numeric_limits<std::int64_t>::max();
  if (args.size() > 2) {
    const auto parsed = parse_number<std::int64_t>(args[2]);
    if (!parsed) {
      std::cerr << "invalid from_ms: " << args[2] << '\n';
      return kExitFailure;
    }
    from_ms = *parsed;
  }
  if (args.size() > 3) {
    const auto parsed = parse_number<std::int64_t>(args[3]);
    if (!parsed) {
      std::cerr << "invalid to_ms: " << args[3] << '\n';
      return kExitFailure;
    }
    to_ms = *parsed;
  }

  const auto report = trail.compliance_report(*tag, from_ms, to_ms);
  std::cout << sealtrail::render_report_text(report);
  return report.integrity_verified ? kExitOk : kExitIntegrityBreak;
}

int run_export(const sealtrail::AuditTrail& trail, const std::vector<std::string_view>& args) {
  if (args.size() < 4) {
    print_usage();
    return kExitFailure;
  }
  const auto start = parse_number<std::uint64_t>(args[1]);
  const auto end = parse_number<std::uint64_t>(args[2]);
  if (!start || !end) {
    std::cerr << "invalid block range\n";
    return kExitFailure;
  }
  const char* access_key = std::getenv("SEALTRAIL_EXPORT_KEY");
  if (access_key == nullptr) {
    std::cerr << "SEALTRAIL_EXPORT_KEY is not set\n";
    return kExitFailure;
  }

  const auto exported = trail.export_range(*start, *end, access_key);
  if (!exported.status.ok) {
    std::cerr << exported.status.message << '\n';
    return exported.verification.broken_at_block ? kExitIntegrityBreak : kExitFailure;
  }

  std::ofstream out(std::string{args[3]}, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    std::cerr << "cannot write " << args[3] << '\n';
    return kExitFailure;
  }
  out << sealtrail::serialize_bundle(*exported.bundle);
  out.flush();
  if (!out.good()) {
    std::cerr << "failed writing " << args[3] << '\n';
    return kExitFailure;
  }
  std::cout << "exported " << exported.bundle->entry_count << " entries to " << args[3] << '\n';
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string_view> args;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    args.push_back(arg);
  }

  if (args.empty() || args[0] == "--help" || args[0] == "help") {
    print_usage();
    return args.empty() ? kExitFailure : kExitOk;
  }

  if (args[0] == "keygen") {
    if (!sealtrail::CryptoEngine::library_ready()) {
      std::cerr << "libsodium initialization failed\n";
      return kExitFailure;
    }
    std::cout << sealtrail::CryptoEngine::generate_key_hex() << '\n';
    return kExitOk;
  }

  sealtrail::AuditConfig config;
  if (!config_path.empty()) {
    const sealtrail::Result loaded = sealtrail::load_config_file(config_path, config);
    if (!loaded.ok) {
      std::cerr << loaded.message << '\n';
      return kExitFailure;
    }
  }
  sealtrail::apply_env_overrides(config);

  sealtrail::AuditTrail trail;
  const sealtrail::Result init = trail.init(config);
  if (!init.ok) {
    std::cerr << "sealtrail init failed: " << init.message << '\n';
    return kExitFailure;
  }

  if (args[0] == "tip") {
    const auto tip = trail.tip();
    std::cout << tip->block_number << ' ' << tip->hash << '\n';
    return kExitOk;
  }
  if (args[0] == "verify") {
    return run_verify(trail, args);
  }
  if (args[0] == "report") {
    return run_report(trail, args);
  }
  if (args[0] == "export") {
    return run_export(trail, args);
  }

  std::cerr << "unknown command: " << args[0] << '\n';
  print_usage();
  return kExitFailure;
}

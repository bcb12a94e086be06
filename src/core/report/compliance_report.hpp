#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/crypto/crypto.hpp"
#include "core/storage/store.hpp"

namespace sealtrail {

struct ReportGroup {
  std::string action;
  std::string resource;
  Outcome result = Outcome::Success;
  RiskLevel risk_level = RiskLevel::Medium;
  std::size_t count = 0;
  std::int64_t first_seen_ms = 0;
  std::int64_t last_seen_ms = 0;
};

struct ComplianceReport {
  ComplianceTag tag = ComplianceTag::PciDss;
  std::int64_t from_ms = 0;
  std::int64_t to_ms = 0;
  std::size_t total_events = 0;
  // Sorted by count, highest first.
  std::vector<ReportGroup> groups;
  std::map<std::string, std::size_t> by_category;
  // Keyed by UTC date, YYYY-MM-DD.
  std::map<std::string, std::size_t> by_day;
  std::size_t unreadable_entries = 0;
  bool integrity_verified = false;
};

// Decrypts every entry tagged with `tag` whose timestamp falls in [from_ms, to_ms].
ComplianceReport generate_compliance_report(const AuditStore& store, const CryptoEngine& crypto,
                                            ComplianceTag tag, std::int64_t from_ms,
                                            std::int64_t to_ms, bool integrity_verified);

std::string render_report_text(const ComplianceReport& report);

}  // namespace sealtrail

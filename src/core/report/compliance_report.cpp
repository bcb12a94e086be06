#include "core/report/compliance_report.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <tuple>

#include "core/model/log_codec.hpp"
#include "core/util/logging.hpp"

namespace sealtrail {
namespace {

std::string utc_day(std::int64_t timestamp_ms) {
  const std::chrono::sys_time<std::chrono::milliseconds> point{
      std::chrono::milliseconds{timestamp_ms}};
  const std::chrono::year_month_day date{std::chrono::floor<std::chrono::days>(point)};

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(date.day());
  return out.str();
}

}  // namespace

ComplianceReport generate_compliance_report(const AuditStore& store, const CryptoEngine& crypto,
                                            ComplianceTag tag, std::int64_t from_ms,
                                            std::int64_t to_ms, bool integrity_verified) {
  ComplianceReport report;
  report.tag = tag;
  report.from_ms = from_ms;
  report.to_ms = to_ms;
  report.integrity_verified = integrity_verified;

  const auto tip = store.last_block();
  if (!tip) {
    return report;
  }

  std::map<std::tuple<std::string, std::string, Outcome, RiskLevel>, ReportGroup> grouped;
  const Result streamed = store.query_range(1, tip->block_number, [&](const SealedEntry& entry) {
    if (!entry.compliance_tags.contains(tag)) {
      return true;
    }
    const auto plain = crypto.decrypt(entry.encrypted_log);
    const auto log = plain ? decode_log(*plain) : std::nullopt;
    if (!log) {
      ++report.unreadable_entries;
      return true;
    }
    if (log->timestamp_ms < from_ms || log->timestamp_ms > to_ms) {
      return true;
    }

    const auto& event = log->event;
    auto& group = grouped[{event.action, event.resource, event.result, event.risk_level}];
    if (group.count == 0) {
      group.action = event.action;
      group.resource = event.resource;
      group.result = event.result;
      group.risk_level = event.risk_level;
      group.first_seen_ms = log->timestamp_ms;
      group.last_seen_ms = log->timestamp_ms;
    }
    ++group.count;
    group.first_seen_ms = std::min(group.first_seen_ms, log->timestamp_ms);
    group.last_seen_ms = std::max(group.last_seen_ms, log->timestamp_ms);

    ++report.total_events;
    ++report.by_category[to_string(event.category)];
    ++report.by_day[utc_day(log->timestamp_ms)];
    return true;
  });

  if (!streamed.ok) {
    logging::logger()->error("compliance report: store query failed: {}", streamed.message);
  }
  if (report.unreadable_entries > 0) {
    logging::logger()->warn("compliance report: {} entries could not be decrypted",
                            report.unreadable_entries);
  }

  report.groups.reserve(grouped.size());
  for (auto& [key, group] : grouped) {
    report.groups.push_back(std::move(group));
  }
  std::ranges::stable_sort(report.groups, [](const ReportGroup& lhs, const ReportGroup& rhs) {
    return lhs.count > rhs.count;
  });
  return report;
}

std::string render_report_text(const ComplianceReport& report) {
  std::ostringstream out;
  out << "Compliance report: " << to_string(report.tag) << '\n';
  out << "Window: " << report.from_ms << " .. " << report.to_ms << '\n';
  out << "Integrity verified: " << (report.integrity_verified ? "yes" : "NO") << '\n';
  out << "Total events: " << report.total_events << '\n';
  if (report.unreadable_entries > 0) {
    out << "Unreadable entries: " << report.unreadable_entries << '\n';
  }

  out << "\nBy category:\n";
  for (const auto& [category, count] : report.by_category) {
    out << "  " << category << '\t' << count << '\n';
  }
  out << "\nBy day (UTC):\n";
  for (const auto& [day, count] : report.by_day) {
    out << "  " << day << '\t' << count << '\n';
  }
  out << "\nGroups:\n";
  for (const auto& group : report.groups) {
    out << "  " << group.count << '\t' << group.action << '\t' << group.resource << '\t'
        << to_string(group.result) << '\t' << to_string(group.risk_level) << '\t'
        << group.first_seen_ms << '\t' << group.last_seen_ms << '\n';
  }
  return out.str();
}

}  // namespace sealtrail

#include "core/model/log_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"

namespace sealtrail {
namespace {

constexpr std::string_view kLogFormat = "sealtrail-log-v1";
constexpr std::string_view kTextPrefix = "s:";
constexpr std::string_view kObjectPrefix = "o:";
constexpr std::string_view kListPrefix = "l:";

std::string list_index_key(std::size_t index) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%08zu", index);
  return buffer;
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

std::string field_or_empty(const std::unordered_map<std::string, std::string>& values,
                           const std::string& key) {
  const auto it = values.find(key);
  return it == values.end() ? std::string{} : it->second;
}

}  // namespace

std::string to_string(EventCategory category) {
  switch (category) {
    case EventCategory::Unspecified:
      return "unspecified";
    case EventCategory::Payment:
      return "payment";
    case EventCategory::Auth:
      return "auth";
    case EventCategory::DataAccess:
      return "data-access";
    case EventCategory::Admin:
      return "admin";
  }
  return "unspecified";
}

std::string to_string(Outcome outcome) {
  return outcome == Outcome::Failure ? "failure" : "success";
}

std::string to_string(RiskLevel level) {
  switch (level) {
    case RiskLevel::Low:
      return "low";
    case RiskLevel::Medium:
      return "medium";
    case RiskLevel::High:
      return "high";
  }
  return "medium";
}

std::string to_string(ComplianceTag tag) {
  switch (tag) {
    case ComplianceTag::PciDss:
      return "PCI_DSS";
    case ComplianceTag::Sox:
      return "SOX";
    case ComplianceTag::Gdpr:
      return "GDPR";
    case ComplianceTag::Aml:
      return "AML";
    case ComplianceTag::FinancialRecord:
      return "FINANCIAL_RECORD";
    case ComplianceTag::PrivacyData:
      return "PRIVACY_DATA";
  }
  return "PCI_DSS";
}

std::optional<EventCategory> category_from_string(std::string_view text) {
  if (text == "payment") {
    return EventCategory::Payment;
  }
  if (text == "auth") {
    return EventCategory::Auth;
  }
  if (text == "data-access") {
    return EventCategory::DataAccess;
  }
  if (text == "admin") {
    return EventCategory::Admin;
  }
  if (text == "unspecified") {
    return EventCategory::Unspecified;
  }
  return std::nullopt;
}

std::optional<Outcome> outcome_from_string(std::string_view text) {
  if (text == "success") {
    return Outcome::Success;
  }
  if (text == "failure") {
    return Outcome::Failure;
  }
  return std::nullopt;
}

std::optional<RiskLevel> risk_level_from_string(std::string_view text) {
  if (text == "low") {
    return RiskLevel::Low;
  }
  if (text == "medium") {
    return RiskLevel::Medium;
  }
  if (text == "high") {
    return RiskLevel::High;
  }
  return std::nullopt;
}

std::optional<ComplianceTag> compliance_tag_from_string(std::string_view text) {
  const std::string upper = [&text] {
    std::string out{text};
    for (auto& c : out) {
      if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
      } else if (c == '-') {
        c = '_';
      }
    }
    return out;
  }();

  if (upper == "PCI_DSS") {
    return ComplianceTag::PciDss;
  }
  if (upper == "SOX") {
    return ComplianceTag::Sox;
  }
  if (upper == "GDPR") {
    return ComplianceTag::Gdpr;
  }
  if (upper == "AML") {
    return ComplianceTag::Aml;
  }
  if (upper == "FINANCIAL_RECORD") {
    return ComplianceTag::FinancialRecord;
  }
  if (upper == "PRIVACY_DATA") {
    return ComplianceTag::PrivacyData;
  }
  return std::nullopt;
}

std::string encode_tags(const std::set<ComplianceTag>& tags) {
  std::string out;
  for (const auto tag : tags) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out.append(to_string(tag));
  }
  return out;
}

std::set<ComplianceTag> decode_tags(std::string_view csv) {
  std::set<ComplianceTag> tags;
  for (const auto& name : util::split_csv(csv)) {
    if (const auto tag = compliance_tag_from_string(name)) {
      tags.insert(*tag);
    }
  }
  return tags;
}

std::string encode_meta(const MetaValue& value) {
  switch (value.kind) {
    case MetaValue::Kind::Text:
      return std::string{kTextPrefix} + value.text;
    case MetaValue::Kind::Object: {
      // Keys are user supplied; hex keeps '=' and newlines out of the key column and
      // preserves byte ordering.
      std::vector<std::pair<std::string, std::string>> fields;
      fields.reserve(value.fields.size());
      for (const auto& field : value.fields) {
        fields.emplace_back("k" + util::to_hex(field.key), encode_meta(field.value));
      }
      return std::string{kObjectPrefix} + util::canonical_join(std::move(fields));
    }
    case MetaValue::Kind::List: {
      std::vector<std::pair<std::string, std::string>> fields;
      fields.reserve(value.items.size());
      for (std::size_t i = 0; i < value.items.size(); ++i) {
        fields.emplace_back(list_index_key(i), encode_meta(value.items[i]));
      }
      return std::string{kListPrefix} + util::canonical_join(std::move(fields));
    }
  }
  return std::string{kTextPrefix};
}

std::optional<MetaValue> decode_meta(std::string_view encoded) {
  if (encoded.starts_with(kTextPrefix)) {
    return MetaValue::of(std::string{encoded.substr(kTextPrefix.size())});
  }

  if (encoded.starts_with(kObjectPrefix)) {
    const auto parsed = util::parse_canonical_map(encoded.substr(kObjectPrefix.size()));
    std::vector<std::pair<std::string, std::string>> ordered(parsed.begin(), parsed.end());
    std::ranges::sort(ordered, [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    std::vector<MetaField> fields;
    fields.reserve(ordered.size());
    for (const auto& [key, child] : ordered) {
      if (key.empty() || key.front() != 'k') {
        return std::nullopt;
      }
      const std::string hex_key = key.substr(1);
      const std::string name = util::from_hex(hex_key);
      if (name.empty() && !hex_key.empty()) {
        return std::nullopt;
      }
      auto value = decode_meta(child);
      if (!value) {
        return std::nullopt;
      }
      fields.push_back({name, std::move(*value)});
    }
    return MetaValue::object(std::move(fields));
  }

  if (encoded.starts_with(kListPrefix)) {
    const auto parsed = util::parse_canonical_map(encoded.substr(kListPrefix.size()));
    std::vector<std::pair<std::string, std::string>> ordered(parsed.begin(), parsed.end());
    std::ranges::sort(ordered, [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    std::vector<MetaValue> items;
    items.reserve(ordered.size());
    for (const auto& [index, child] : ordered) {
      auto value = decode_meta(child);
      if (!value) {
        return std::nullopt;
      }
      items.push_back(std::move(*value));
    }
    return MetaValue::list(std::move(items));
  }

  return std::nullopt;
}

std::string encode_log(const AuditLog& log) {
  const SanitizedEvent& event = log.event;
  std::vector<std::pair<std::string, std::string>> fields = {
      {"format", std::string{kLogFormat}},
      {"timestamp_ms", std::to_string(log.timestamp_ms)},
      {"category", to_string(event.category)},
      {"actor_id", event.actor_id},
      {"device_id", event.device_id},
      {"action", event.action},
      {"resource", event.resource},
      {"result", to_string(event.result)},
      {"network_origin", event.network_origin},
      {"user_agent", event.user_agent},
      {"correlation_id", event.correlation_id},
      {"metadata", encode_meta(event.metadata)},
      {"risk_level", to_string(event.risk_level)},
      {"sensitive_data_accessed", event.sensitive_data_accessed ? "1" : "0"},
      {"compliance_tags", encode_tags(event.compliance_tags)},
  };

  if (event.changes) {
    fields.emplace_back("changes", util::canonical_join({
                                       {"after", encode_meta(event.changes->after)},
                                       {"before", encode_meta(event.changes->before)},
                                   }));
  }

  return util::canonical_join(std::move(fields));
}

std::optional<AuditLog> decode_log(std::string_view encoded) {
  const auto values = util::parse_canonical_map(encoded);
  if (field_or_empty(values, "format") != kLogFormat) {
    return std::nullopt;
  }

  AuditLog log;
  if (!parse_int64(field_or_empty(values, "timestamp_ms"), log.timestamp_ms)) {
    return std::nullopt;
  }

  const auto category = category_from_string(field_or_empty(values, "category"));
  const auto result = outcome_from_string(field_or_empty(values, "result"));
  const auto risk = risk_level_from_string(field_or_empty(values, "risk_level"));
  auto metadata = decode_meta(field_or_empty(values, "metadata"));
  if (!category || !result || !risk || !metadata) {
    return std::nullopt;
  }

  SanitizedEvent& event = log.event;
  event.category = *category;
  event.actor_id = field_or_empty(values, "actor_id");
  event.device_id = field_or_empty(values, "device_id");
  event.action = field_or_empty(values, "action");
  event.resource = field_or_empty(values, "resource");
  event.result = *result;
  event.network_origin = field_or_empty(values, "network_origin");
  event.user_agent = field_or_empty(values, "user_agent");
  event.correlation_id = field_or_empty(values, "correlation_id");
  event.metadata = std::move(*metadata);
  event.risk_level = *risk;
  event.sensitive_data_accessed = field_or_empty(values, "sensitive_data_accessed") == "1";
  event.compliance_tags = decode_tags(field_or_empty(values, "compliance_tags"));

  if (values.contains("changes")) {
    const auto snapshot = util::parse_canonical_map(values.at("changes"));
    auto before = decode_meta(field_or_empty(snapshot, "before"));
    auto after = decode_meta(field_or_empty(snapshot, "after"));
    if (!before || !after) {
      return std::nullopt;
    }
    event.changes = ChangeSnapshot{std::move(*before), std::move(*after)};
  }

  return log;
}

}  // namespace sealtrail

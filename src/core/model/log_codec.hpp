#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace sealtrail {

std::string to_string(EventCategory category);
std::string to_string(Outcome outcome);
std::string to_string(RiskLevel level);
std::string to_string(ComplianceTag tag);

std::optional<EventCategory> category_from_string(std::string_view text);
std::optional<Outcome> outcome_from_string(std::string_view text);
std::optional<RiskLevel> risk_level_from_string(std::string_view text);
std::optional<ComplianceTag> compliance_tag_from_string(std::string_view text);

std::string encode_tags(const std::set<ComplianceTag>& tags);
std::set<ComplianceTag> decode_tags(std::string_view csv);

// Canonical, order-stable encoding: keys are sorted at every nesting level, so equal
// logical content always yields equal bytes. These bytes are what gets hashed, signed and
// encrypted.
std::string encode_meta(const MetaValue& value);
std::optional<MetaValue> decode_meta(std::string_view encoded);

std::string encode_log(const AuditLog& log);
std::optional<AuditLog> decode_log(std::string_view encoded);

}  // namespace sealtrail

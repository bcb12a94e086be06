#include "core/audit/sanitizer.hpp"

#include <algorithm>
#include <utility>

#include "core/util/canonical.hpp"

namespace sealtrail {

Sanitizer::Sanitizer(SanitizerPolicy policy) : policy_(std::move(policy)) {
  lowered_patterns_.reserve(policy_.sensitive_field_patterns.size());
  for (const auto& pattern : policy_.sensitive_field_patterns) {
    std::string lowered = util::lowercase_copy(util::trim_copy(pattern));
    if (!lowered.empty()) {
      lowered_patterns_.push_back(std::move(lowered));
    }
  }
}

SanitizedEvent Sanitizer::sanitize(const AuditEvent& event) const {
  SanitizedEvent out{event};
  out.metadata = redact(event.metadata);
  if (event.changes) {
    out.changes = ChangeSnapshot{redact(event.changes->before), redact(event.changes->after)};
  }
  return out;
}

bool Sanitizer::is_sensitive_key(std::string_view key) const {
  const std::string lowered = util::lowercase_copy(key);
  return std::ranges::any_of(lowered_patterns_, [&lowered](const std::string& pattern) {
    return lowered.find(pattern) != std::string::npos;
  });
}

MetaValue Sanitizer::redact(const MetaValue& value) const {
  switch (value.kind) {
    case MetaValue::Kind::Text:
      return value;
    case MetaValue::Kind::Object: {
      std::vector<MetaField> fields;
      fields.reserve(value.fields.size());
      for (const auto& field : value.fields) {
        if (is_sensitive_key(field.key)) {
          fields.push_back({field.key, MetaValue::of(policy_.redaction_token)});
        } else {
          fields.push_back({field.key, redact(field.value)});
        }
      }
      return MetaValue::object(std::move(fields));
    }
    case MetaValue::Kind::List: {
      std::vector<MetaValue> items;
      items.reserve(value.items.size());
      for (const auto& item : value.items) {
        items.push_back(redact(item));
      }
      return MetaValue::list(std::move(items));
    }
  }
  return value;
}

}  // namespace sealtrail

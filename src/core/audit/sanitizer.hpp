#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace sealtrail {

class Sanitizer {
public:
  explicit Sanitizer(SanitizerPolicy policy = {});

  // Replaces the value of every object field whose key contains a sensitive pattern
  // (case-insensitive) with the redaction token, at any depth of metadata, list items and
  // both change snapshots. Never fails.
  [[nodiscard]] SanitizedEvent sanitize(const AuditEvent& event) const;

  [[nodiscard]] bool is_sensitive_key(std::string_view key) const;
  [[nodiscard]] const SanitizerPolicy& policy() const { return policy_; }

private:
  [[nodiscard]] MetaValue redact(const MetaValue& value) const;

  SanitizerPolicy policy_;
  std::vector<std::string> lowered_patterns_;
};

}  // namespace sealtrail

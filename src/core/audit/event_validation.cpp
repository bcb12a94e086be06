#include "core/audit/event_validation.hpp"

#include <set>
#include <string_view>
#include <utility>

#include "core/crypto/crypto.hpp"
#include "core/model/log_codec.hpp"
#include "core/util/canonical.hpp"

namespace sealtrail {
namespace {

// Canonical decoding keeps one value per key, so duplicates could not survive a round trip.
bool has_duplicate_keys(const MetaValue& value) {
  if (value.kind == MetaValue::Kind::List) {
    for (const auto& item : value.items) {
      if (has_duplicate_keys(item)) {
        return true;
      }
    }
    return false;
  }

  std::set<std::string_view> seen;
  for (const auto& field : value.fields) {
    if (!seen.insert(field.key).second || has_duplicate_keys(field.value)) {
      return true;
    }
  }
  return false;
}

}  // namespace

Result validate_event(const AuditEvent& event) {
  if (event.category == EventCategory::Unspecified) {
    return Result::failure("Audit event rejected: category is required.", ErrorKind::Validation);
  }
  if (util::trim_copy(event.actor_id).empty()) {
    return Result::failure("Audit event rejected: actor id is required.", ErrorKind::Validation);
  }
  if (!event.metadata.is_object()) {
    return Result::failure("Audit event rejected: metadata must be an object.",
                           ErrorKind::Validation);
  }
  if (has_duplicate_keys(event.metadata) ||
      (event.changes &&
       (has_duplicate_keys(event.changes->before) || has_duplicate_keys(event.changes->after)))) {
    return Result::failure("Audit event rejected: metadata repeats a key.", ErrorKind::Validation);
  }
  return Result::success();
}

AuditEvent with_event_defaults(AuditEvent event) {
  if (event.action.empty()) {
    event.action = to_string(event.category);
  }
  if (event.correlation_id.empty()) {
    event.correlation_id = CryptoEngine::random_id();
  }
  return event;
}

}  // namespace sealtrail

#pragma once

#include "core/model/types.hpp"

namespace sealtrail {

// Rejects events missing a category or an actor, or whose metadata repeats a key
// (ErrorKind::Validation).
Result validate_event(const AuditEvent& event);

// Fills caller-omitted defaults: action falls back to the category name and an empty
// correlation id gets a fresh UUID.
AuditEvent with_event_defaults(AuditEvent event);

}  // namespace sealtrail

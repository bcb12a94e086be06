#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "core/model/types.hpp"

namespace sealtrail {

// key=value lines, '#' comments. Unknown keys are ignored; malformed numbers fail.
Result load_config_file(std::string_view path, AuditConfig& config);
Result apply_config_values(const std::unordered_map<std::string, std::string>& values,
                           AuditConfig& config);

// SEALTRAIL_DATA_DIR, SEALTRAIL_STORE, SEALTRAIL_SIGNING_KEY, SEALTRAIL_ENCRYPTION_KEY,
// SEALTRAIL_LOG_LEVEL.
void apply_env_overrides(AuditConfig& config);

Result validate_config(const AuditConfig& config);

}  // namespace sealtrail

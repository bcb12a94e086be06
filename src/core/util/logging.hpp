#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sealtrail::logging {

// Named "sealtrail" logger writing to stderr; created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace" .. "critical", "off"); unknown names fall back to info.
void set_level(std::string_view level);

}  // namespace sealtrail::logging

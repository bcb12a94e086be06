#include "core/util/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace sealtrail::logging {
namespace {

constexpr const char* kLoggerName = "sealtrail";

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (spdlog::get(kLoggerName) == nullptr) {
      auto created = spdlog::stderr_color_mt(kLoggerName);
      created->set_pattern("%Y-%m-%dT%H:%M:%S.%e [%n] [%^%l%$] %v");
    }
  });
  return spdlog::get(kLoggerName);
}

void set_level(std::string_view level) {
  auto parsed = spdlog::level::from_str(std::string{level});
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  logger()->set_level(parsed);
}

}  // namespace sealtrail::logging

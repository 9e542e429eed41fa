#include "core/util/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pawledger::util {

std::shared_ptr<spdlog::logger> ledger_logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(once, [] {
    logger = spdlog::get("paw-ledger");
    if (!logger) {
      logger = spdlog::stderr_color_mt("paw-ledger");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
  });
  return logger;
}

bool set_log_level(std::string_view level_name) {
  const std::string name{level_name};
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return false;
  }
  ledger_logger()->set_level(level);
  return true;
}

}  // namespace pawledger::util

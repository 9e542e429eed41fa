#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pawledger::util {

// Shared "paw-ledger" logger writing to stderr.
std::shared_ptr<spdlog::logger> ledger_logger();

// Accepts spdlog level names (trace, debug, info, warn, err, critical, off).
bool set_log_level(std::string_view level_name);

}  // namespace pawledger::util

#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace pawledger {

// Role identities must be non-empty (ZeroAddress); limits must be positive and
// the fee may not exceed the basis-point denominator and reputation deltas
// must lie in [0, kMaxReputationDelta] (InvalidConfig).
Result validate_ledger_config(const LedgerConfig& config);

// Reads key=value lines from path on top of the values already in config.
// Keys are case-insensitive. Lines starting with '#' and unknown keys are ignored.
Result load_ledger_config(std::string_view path, LedgerConfig& config);

// Canonical key=value rendering of every setting.
std::string render_ledger_config(const LedgerConfig& config);

}  // namespace pawledger

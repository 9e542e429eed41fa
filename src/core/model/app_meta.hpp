#pragma once

#include <string_view>

#ifndef PAW_LEDGER_APP_VERSION
#define PAW_LEDGER_APP_VERSION "0.1.0"
#endif

#ifndef PAW_LEDGER_BUILD_RELEASE
#define PAW_LEDGER_BUILD_RELEASE "In-memory ledger"
#endif

namespace pawledger {

inline constexpr std::string_view kAppDisplayName = "Paw Ledger::Snippet Tips & Hints";
inline constexpr std::string_view kTipUnitName = "paws";
inline constexpr std::string_view kAppVersion = PAW_LEDGER_APP_VERSION;
inline constexpr std::string_view kBuildRelease = PAW_LEDGER_BUILD_RELEASE;

}  // namespace pawledger

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

#include "core/config/ledger_config.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/events.hpp"
#include "core/service/ledger_service.hpp"
#include "core/util/log.hpp"

namespace {

constexpr std::string_view kDemoAuthor = "0xA11ce0000000000000000000000000000000A11c";
constexpr std::string_view kDemoFan = "0xB0b0000000000000000000000000000000000B0b";

void print_usage() {
  std::cout << "usage: paw_ledger_cli [--config <file>] [--log-level <level>]\n";
}

bool step(const pawledger::Result& result, std::string_view label) {
  if (!result.ok) {
    std::cerr << label << " failed [" << pawledger::error_name(result.error) << "]: " << result.message << '\n';
    return false;
  }
  std::cout << label << ": " << result.message << '\n';
  return true;
}

bool run_demo(pawledger::LedgerService& ledger) {
  const pawledger::LedgerConfig config = ledger.config();

  std::uint64_t snippet_id = 0;
  if (!step(ledger.submit_snippet(
                {
                    .author = std::string{kDemoAuthor},
                    .content = "def paw(n):\n    return n * 2\n",
                    .language_id = ledger.language_id_for("python"),
                    .title = "double the paws",
                },
                snippet_id),
            "submit")) {
    return false;
  }

  pawledger::TipReceipt receipt;
  if (!step(ledger.tip_snippet(snippet_id, kDemoFan, 1000, receipt), "tip")) {
    return false;
  }
  std::cout << "  fee=" << receipt.fee << " to_author=" << receipt.to_author << '\n';

  std::int64_t score = 0;
  if (!step(ledger.upvote_snippet(snippet_id, kDemoFan, score), "upvote")) {
    return false;
  }

  std::uint64_t hint_id = 0;
  if (!step(ledger.request_hint(kDemoFan, ledger.content_id("how do I triple paws?"), snippet_id, hint_id),
            "request hint") ||
      !step(ledger.fulfill_hint(hint_id, config.fulfiller), "fulfill hint")) {
    return false;
  }

  pawledger::Amount withdrawn = 0;
  pawledger::Amount swept = 0;
  if (!step(ledger.withdraw_tips(kDemoAuthor, withdrawn), "withdraw") ||
      !step(ledger.sweep_treasury(config.treasury, swept), "sweep treasury")) {
    return false;
  }
  return step(ledger.award_badge(kDemoAuthor, 0, config.curator), "badge");
}

void print_stats(const pawledger::LedgerService& ledger) {
  const pawledger::LedgerStats stats = ledger.stats();
  std::cout << "\nStats\n";
  std::cout << "  snippets:        " << stats.snippet_count << '\n';
  std::cout << "  hints:           " << stats.hint_count << '\n';
  std::cout << "  languages:       " << stats.registered_language_count << '\n';
  std::cout << "  tips received:   " << stats.total_tips_received << ' ' << pawledger::kTipUnitName << '\n';
  std::cout << "  tips withdrawn:  " << stats.total_tips_withdrawn << ' ' << pawledger::kTipUnitName << '\n';
  std::cout << "  treasury fees:   " << stats.total_treasury_fees << ' ' << pawledger::kTipUnitName << '\n';
  std::cout << "  treasury swept:  " << stats.total_treasury_swept << ' ' << pawledger::kTipUnitName << '\n';

  std::cout << "\nAudit trail\n";
  for (const auto& event : ledger.events()) {
    std::cout << "--\n" << pawledger::event_payload(event);
  }
}

}  // namespace

int main(int argc, char** argv) {
  pawledger::LedgerConfig config;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if ((arg == "--config" || arg == "--log-level") && i + 1 >= argc) {
      print_usage();
      return 2;
    }
    if (arg == "--config") {
      const pawledger::Result loaded = pawledger::load_ledger_config(argv[++i], config);
      if (!loaded.ok) {
        std::cerr << "config error [" << pawledger::error_name(loaded.error) << "]: " << loaded.message << '\n';
        return 1;
      }
    } else if (arg == "--log-level") {
      if (!pawledger::util::set_log_level(argv[++i])) {
        std::cerr << "unknown log level: " << argv[i] << '\n';
        return 2;
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      print_usage();
      return 2;
    }
  }

  std::cout << pawledger::kAppDisplayName << " v" << pawledger::kAppVersion << " (" << pawledger::kBuildRelease
            << ")\n\n";

  pawledger::LedgerService ledger;
  if (!step(ledger.init(config), "init")) {
    return 1;
  }
  const bool ok = run_demo(ledger);
  print_stats(ledger);
  return ok ? 0 : 1;
}

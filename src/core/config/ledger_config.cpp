#include "core/config/ledger_config.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace pawledger {
namespace {

template <typename T>
bool parse_number(std::string_view text, T& out) {
  T parsed = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return false;
  }
  out = parsed;
  return true;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return {};
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

Result apply_values(const std::unordered_map<std::string, std::string>& raw, LedgerConfig& config) {
  std::unordered_map<std::string, std::string> values;
  for (const auto& [key, value] : raw) {
    values.emplace(util::lowercase_copy(util::trim_copy(key)), util::trim_copy(value));
  }

  const auto assign_text = [&values](std::string_view key, std::string& target) {
    const auto it = values.find(std::string{key});
    if (it != values.end()) {
      target = it->second;
    }
  };

  assign_text("curator", config.curator);
  assign_text("treasury", config.treasury);
  assign_text("fulfiller", config.fulfiller);

  std::string bad_key;
  const auto assign_number = [&values, &bad_key](std::string_view key, auto& target) {
    const auto it = values.find(std::string{key});
    if (it == values.end() || !bad_key.empty()) {
      return;
    }
    if (!parse_number(it->second, target)) {
      bad_key = std::string{key};
    }
  };

  assign_number("max_snippet_bytes", config.max_snippet_bytes);
  assign_number("max_title_bytes", config.max_title_bytes);
  assign_number("min_tip_units", config.min_tip_units);
  assign_number("max_snippets_per_author", config.max_snippets_per_author);
  assign_number("max_open_hints_per_user", config.max_open_hints_per_user);
  assign_number("treasury_fee_bps", config.treasury_fee_bps);
  assign_number("bps_denominator", config.bps_denominator);
  assign_number("reputation_up_delta", config.reputation_up_delta);
  assign_number("reputation_down_delta", config.reputation_down_delta);
  assign_number("badge_slots", config.badge_slots);
  assign_number("recent_queue_size", config.recent_queue_size);
  assign_number("max_tags_per_snippet", config.max_tags_per_snippet);
  assign_number("max_submit_batch", config.max_submit_batch);
  assign_number("max_tip_batch", config.max_tip_batch);
  assign_number("schema_version", config.schema_version);

  if (!bad_key.empty()) {
    return Result::failure(LedgerError::InvalidConfig, "Config value for '" + bad_key + "' is not a number.");
  }
  return Result::success("Config values applied.");
}

}  // namespace

Result validate_ledger_config(const LedgerConfig& config) {
  if (config.curator.empty() || config.treasury.empty() || config.fulfiller.empty()) {
    return Result::failure(LedgerError::ZeroAddress, "Role identities must not be empty.");
  }
  if (config.max_snippet_bytes == 0 || config.max_title_bytes == 0 || config.max_snippets_per_author == 0 ||
      config.max_open_hints_per_user == 0 || config.recent_queue_size == 0 || config.max_submit_batch == 0 ||
      config.max_tip_batch == 0 || config.bps_denominator == 0) {
    return Result::failure(LedgerError::InvalidConfig, "Ledger limits must be positive.");
  }
  if (config.treasury_fee_bps > config.bps_denominator) {
    return Result::failure(LedgerError::InvalidConfig, "Treasury fee exceeds the basis-point denominator.");
  }
  if (config.badge_slots > 8) {
    return Result::failure(LedgerError::InvalidConfig, "At most 8 badge slots are supported.");
  }
  if (config.reputation_up_delta < 0 || config.reputation_down_delta < 0) {
    return Result::failure(LedgerError::InvalidConfig, "Reputation deltas must not be negative.");
  }
  if (config.reputation_up_delta > kMaxReputationDelta || config.reputation_down_delta > kMaxReputationDelta) {
    return Result::failure(LedgerError::InvalidConfig,
                           "Reputation deltas may not exceed " + std::to_string(kMaxReputationDelta) + ".");
  }
  return Result::success("Ledger config is valid.");
}

Result load_ledger_config(std::string_view path, LedgerConfig& config) {
  const std::filesystem::path file{std::string{path}};
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec) || ec) {
    return Result::failure(LedgerError::ConfigUnreadable, "Config file not found: " + file.string());
  }

  const std::string text = read_file(file);
  LedgerConfig candidate = config;
  const Result applied = apply_values(util::parse_canonical_map(text), candidate);
  if (!applied.ok) {
    util::ledger_logger()->warn("config {} rejected: {}", file.string(), applied.message);
    return applied;
  }
  if (const Result valid = validate_ledger_config(candidate); !valid.ok) {
    util::ledger_logger()->warn("config {} rejected: {}", file.string(), valid.message);
    return valid;
  }

  config = std::move(candidate);
  util::ledger_logger()->info("loaded ledger config from {}", file.string());
  return Result::success("Ledger config loaded.", file.string());
}

std::string render_ledger_config(const LedgerConfig& config) {
  return util::canonical_join({
      {"curator", config.curator},
      {"treasury", config.treasury},
      {"fulfiller", config.fulfiller},
      {"max_snippet_bytes", std::to_string(config.max_snippet_bytes)},
      {"max_title_bytes", std::to_string(config.max_title_bytes)},
      {"min_tip_units", std::to_string(config.min_tip_units)},
      {"max_snippets_per_author", std::to_string(config.max_snippets_per_author)},
      {"max_open_hints_per_user", std::to_string(config.max_open_hints_per_user)},
      {"treasury_fee_bps", std::to_string(config.treasury_fee_bps)},
      {"bps_denominator", std::to_string(config.bps_denominator)},
      {"reputation_up_delta", std::to_string(config.reputation_up_delta)},
      {"reputation_down_delta", std::to_string(config.reputation_down_delta)},
      {"badge_slots", std::to_string(config.badge_slots)},
      {"recent_queue_size", std::to_string(config.recent_queue_size)},
      {"max_tags_per_snippet", std::to_string(config.max_tags_per_snippet)},
      {"max_submit_batch", std::to_string(config.max_submit_batch)},
      {"max_tip_batch", std::to_string(config.max_tip_batch)},
      {"schema_version", std::to_string(config.schema_version)},
  });
}

}  // namespace pawledger

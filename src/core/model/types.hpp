#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace pawledger {

// Tip amounts have no upper bound.
using Amount = boost::multiprecision::cpp_int;

enum class LedgerError {
  None,
  CuratorOnly,
  TreasuryOnly,
  FulfillerOnly,
  Paused,
  SnippetTooLong,
  TitleTooLong,
  InvalidSnippetId,
  SnippetDeleted,
  NotAuthor,
  AuthorSnippetCap,
  HintRequestCap,
  InvalidHintId,
  HintAlreadyFulfilled,
  TipTooSmall,
  InsufficientBalance,
  LanguageNotRegistered,
  LanguageAlreadyRegistered,
  AlreadyUpvoted,
  AlreadyDownvoted,
  CannotVoteOwn,
  ZeroAddress,
  BatchTooLarge,
  BatchLengthMismatch,
  InvalidConfig,
  ConfigUnreadable,
};

const char* error_name(LedgerError error);

struct Result {
  bool ok = false;
  LedgerError error = LedgerError::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, LedgerError::None, std::move(msg), std::move(payload)};
  }

  static Result failure(LedgerError error, std::string msg) {
    return {false, error, std::move(msg), {}};
  }
};

inline constexpr std::string_view kDefaultCuratorAddr = "0x2F5a8C1e4B7d0A3f6C9b2E5d8a1F4c7B0e3A6d9F";
inline constexpr std::string_view kDefaultTreasuryAddr = "0x8D1f4A7c0B3e6D9a2F5c8E1b4A7d0C3f6E9a2B5";
inline constexpr std::string_view kDefaultFulfillerAddr = "0xE3b6D9a2C5f8E1b4A7d0C3f6E9a2B5d8F1c4A7";

// Upper bound for a single vote's reputation delta.
inline constexpr std::int64_t kMaxReputationDelta = 1'000'000;

struct LedgerConfig {
  std::string curator{kDefaultCuratorAddr};
  std::string treasury{kDefaultTreasuryAddr};
  std::string fulfiller{kDefaultFulfillerAddr};

  std::size_t max_snippet_bytes = 2048;
  std::size_t max_title_bytes = 64;
  std::uint64_t min_tip_units = 10;
  std::size_t max_snippets_per_author = 64;
  std::size_t max_open_hints_per_user = 24;
  std::uint64_t treasury_fee_bps = 25;
  std::uint64_t bps_denominator = 10000;
  std::int64_t reputation_up_delta = 1;
  std::int64_t reputation_down_delta = 1;
  std::uint32_t badge_slots = 8;
  std::size_t recent_queue_size = 64;
  std::size_t max_tags_per_snippet = 4;
  std::size_t max_submit_batch = 12;
  std::size_t max_tip_batch = 16;
  std::uint32_t schema_version = 1;
};

struct Snippet {
  std::uint64_t snippet_id = 0;
  std::string author;
  std::string content_hash;
  std::string language_id;
  std::string title_hash;
  std::int64_t created_unix_ms = 0;
  std::int64_t updated_unix_ms = 0;
  Amount tip_balance = 0;
  std::int64_t reputation = 0;
  bool deleted = false;
  std::vector<std::string> tags;
};

struct HintRequest {
  std::uint64_t hint_id = 0;
  std::string requester;
  std::string topic_hash;
  std::uint64_t snippet_id = 0;
  std::int64_t created_unix_ms = 0;
  bool fulfilled = false;
  std::string fulfiller;
  std::int64_t fulfilled_unix_ms = 0;
};

struct SnippetDraft {
  std::string author;
  std::string content;
  std::string language_id;
  std::optional<std::string> title;
};

struct TipReceipt {
  std::uint64_t snippet_id = 0;
  Amount amount = 0;
  Amount fee = 0;
  Amount to_author = 0;
};

struct BatchSubmitReport {
  std::vector<std::uint64_t> snippet_ids;
  LedgerError stopped_by = LedgerError::None;
  std::size_t stopped_at = 0;
  std::string stop_message;
};

struct LedgerStats {
  Amount total_tips_received = 0;
  Amount total_tips_withdrawn = 0;
  Amount total_treasury_fees = 0;
  Amount total_treasury_swept = 0;
  std::uint64_t snippet_count = 0;
  std::uint64_t hint_count = 0;
  std::size_t registered_language_count = 0;
  std::size_t event_count = 0;
  bool paused = false;
};

}  // namespace pawledger

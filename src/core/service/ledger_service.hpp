#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/model/events.hpp"
#include "core/model/types.hpp"

namespace pawledger {

// In-memory snippet ledger. Every public operation is safe to call from
// concurrent threads; mutations validate first and only then touch state.
class LedgerService {
public:
  using Clock = std::function<std::int64_t()>;
  // The hasher is always called without the engine lock held and may call
  // back into the ledger. The clock is sampled under the lock and must not.
  using ContentHasher = std::function<std::string(std::string_view)>;

  LedgerService();
  LedgerService(Clock clock, ContentHasher hasher);

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;

  // Validates config and starts a fresh ledger with it.
  Result init(const LedgerConfig& config);

  Result submit_snippet(const SnippetDraft& draft, std::uint64_t& out_snippet_id);
  Result update_snippet(std::uint64_t snippet_id, std::string_view author, std::string_view new_content);
  Result delete_snippet(std::uint64_t snippet_id, std::string_view author);
  Result tip_snippet(std::uint64_t snippet_id, std::string_view tipper, const Amount& amount,
                     TipReceipt& out_receipt);
  Result withdraw_tips(std::string_view author, Amount& out_amount);

  Result request_hint(std::string_view requester, std::string_view topic_hash, std::uint64_t snippet_id,
                      std::uint64_t& out_hint_id);
  Result fulfill_hint(std::uint64_t hint_id, std::string_view fulfiller);

  Result register_language(std::string_view language_id, std::string_view curator);
  Result upvote_snippet(std::uint64_t snippet_id, std::string_view voter, std::int64_t& out_score);
  Result downvote_snippet(std::uint64_t snippet_id, std::string_view voter, std::int64_t& out_score);
  Result set_paused(bool paused, std::string_view curator);
  Result award_badge(std::string_view account, std::uint32_t slot, std::string_view curator);
  Result add_snippet_tag(std::uint64_t snippet_id, std::string_view tag_hash, std::string_view author);
  Result sweep_treasury(std::string_view treasury, Amount& out_amount);

  // Stops at the first rejected entry; ids created before it are kept and the
  // call still succeeds. out_report names the entry and error that stopped it.
  Result submit_snippet_batch(std::string_view author, const std::vector<std::string>& contents,
                              const std::vector<std::optional<std::string>>& titles,
                              std::string_view language_id, BatchSubmitReport& out_report);
  // The first rejected tip fails the call. Tips applied before it stay applied.
  Result tip_snippet_batch(std::string_view tipper, const std::vector<std::uint64_t>& snippet_ids,
                           const std::vector<Amount>& amounts, std::vector<TipReceipt>& out_receipts);

  [[nodiscard]] std::optional<Snippet> snippet(std::uint64_t snippet_id) const;
  [[nodiscard]] std::optional<HintRequest> hint(std::uint64_t hint_id) const;
  [[nodiscard]] Amount tip_balance(std::string_view author) const;
  [[nodiscard]] std::int64_t reputation(std::string_view author) const;
  [[nodiscard]] std::uint8_t badges(std::string_view account) const;
  [[nodiscard]] bool has_badge(std::string_view account, std::uint32_t slot) const;
  [[nodiscard]] std::vector<std::uint64_t> snippets_by_author(std::string_view author) const;
  [[nodiscard]] std::size_t active_snippet_count(std::string_view author) const;
  [[nodiscard]] std::uint64_t language_count(std::string_view language_id) const;
  [[nodiscard]] bool is_language_registered(std::string_view language_id) const;
  [[nodiscard]] std::vector<std::uint64_t> recent_snippet_ids() const;
  [[nodiscard]] std::vector<std::uint64_t> open_hints(std::string_view requester) const;
  [[nodiscard]] std::vector<std::uint64_t> hints_by_requester(std::string_view requester) const;
  [[nodiscard]] std::vector<std::uint64_t> snippets_by_content_hash(std::string_view content_hash) const;
  [[nodiscard]] std::vector<std::string> snippet_tags(std::uint64_t snippet_id) const;
  [[nodiscard]] bool has_upvoted(std::string_view voter, std::uint64_t snippet_id) const;
  [[nodiscard]] bool has_downvoted(std::string_view voter, std::uint64_t snippet_id) const;
  [[nodiscard]] bool paused() const;
  [[nodiscard]] Amount treasury_pending() const;
  [[nodiscard]] LedgerConfig config() const;
  [[nodiscard]] LedgerStats stats() const;
  [[nodiscard]] std::vector<LedgerEvent> events() const;
  [[nodiscard]] std::size_t event_count() const;

  [[nodiscard]] std::string content_id(std::string_view payload) const { return hasher_(payload); }
  [[nodiscard]] std::string language_id_for(std::string_view language_name) const {
    return hasher_(language_name);
  }

private:
  struct AuthorState {
    Amount withdrawable = 0;
    std::int64_t reputation = 0;
    std::uint8_t badges = 0;
    std::vector<std::uint64_t> snippet_ids;
  };

  struct VoterState {
    std::unordered_set<std::uint64_t> upvoted;
    std::unordered_set<std::uint64_t> downvoted;
  };

  enum class VoteDirection { Up, Down };

  std::vector<std::string> builtin_language_ids() const;
  void reset_state(const std::vector<std::string>& language_ids);
  std::int64_t stamp_now();
  void append_event(EventPayload payload, std::int64_t unix_ms);
  void push_recent(std::uint64_t snippet_id);
  Result reject(std::string_view operation, LedgerError error, std::string message) const;

  // Callers hold mutex_.
  Result check_live_snippet(std::uint64_t snippet_id) const;
  Result check_submission(const SnippetDraft& draft) const;
  Result check_tip(std::uint64_t snippet_id, const Amount& amount) const;
  std::uint64_t insert_snippet(const SnippetDraft& draft, std::string content_hash, std::string title_hash);
  TipReceipt apply_tip(std::uint64_t snippet_id, std::string_view tipper, const Amount& amount);
  Result cast_vote(std::uint64_t snippet_id, std::string_view voter, VoteDirection direction,
                   std::int64_t& out_score);
  std::size_t active_count_locked(std::string_view author) const;
  void recompute_reputation(const std::string& author);

  bool is_curator(std::string_view caller) const;
  bool is_treasury(std::string_view caller) const;
  bool is_fulfiller(std::string_view caller) const;

  Clock clock_;
  ContentHasher hasher_;

  mutable std::mutex mutex_;
  LedgerConfig config_;
  bool paused_ = false;
  std::int64_t last_stamp_ms_ = 0;

  std::uint64_t next_snippet_id_ = 1;
  std::uint64_t next_hint_id_ = 1;
  std::unordered_map<std::uint64_t, Snippet> snippets_;
  std::unordered_map<std::uint64_t, HintRequest> hints_;
  std::unordered_map<std::string, AuthorState> authors_;
  std::unordered_map<std::string, VoterState> voters_;
  std::unordered_map<std::string, std::vector<std::uint64_t>> hints_by_requester_;
  std::unordered_map<std::string, std::uint64_t> language_counts_;

  Amount total_tips_received_ = 0;
  Amount total_tips_withdrawn_ = 0;
  Amount total_treasury_fees_ = 0;
  Amount total_treasury_swept_ = 0;

  std::vector<LedgerEvent> events_;

  // Newest first. Guarded by recent_mutex_, always taken after mutex_.
  mutable std::mutex recent_mutex_;
  std::deque<std::uint64_t> recent_snippets_;
};

}  // namespace pawledger

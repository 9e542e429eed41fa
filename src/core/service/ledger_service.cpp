#include "core/service/ledger_service.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#include "core/config/ledger_config.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace pawledger {
namespace {

constexpr std::array<std::string_view, 4> kBuiltinLanguages = {"solidity", "python", "javascript", "rust"};

std::int64_t clamp_at_zero(std::int64_t score) {
  return score < 0 ? 0 : score;
}

}  // namespace

LedgerService::LedgerService()
    : LedgerService(util::unix_timestamp_ms_now, [](std::string_view payload) {
        return util::sha256_hex(payload);
      }) {}

LedgerService::LedgerService(Clock clock, ContentHasher hasher)
    : clock_(std::move(clock)), hasher_(std::move(hasher)) {
  reset_state(builtin_language_ids());
}

Result LedgerService::init(const LedgerConfig& config) {
  if (const Result valid = validate_ledger_config(config); !valid.ok) {
    return reject("init", valid.error, valid.message);
  }
  if (!util::init_crypto()) {
    return reject("init", LedgerError::InvalidConfig, "libsodium initialization failed.");
  }

  const std::vector<std::string> language_ids = builtin_language_ids();
  std::lock_guard lock(mutex_);
  config_ = config;
  reset_state(language_ids);
  util::ledger_logger()->info("ledger initialised (schema v{}, {} built-in languages)", config_.schema_version,
                              kBuiltinLanguages.size());
  return Result::success("Ledger initialised.");
}

std::vector<std::string> LedgerService::builtin_language_ids() const {
  std::vector<std::string> ids;
  ids.reserve(kBuiltinLanguages.size());
  for (const std::string_view name : kBuiltinLanguages) {
    ids.push_back(hasher_(name));
  }
  return ids;
}

void LedgerService::reset_state(const std::vector<std::string>& language_ids) {
  paused_ = false;
  last_stamp_ms_ = 0;
  next_snippet_id_ = 1;
  next_hint_id_ = 1;
  snippets_.clear();
  hints_.clear();
  authors_.clear();
  voters_.clear();
  hints_by_requester_.clear();
  language_counts_.clear();
  total_tips_received_ = 0;
  total_tips_withdrawn_ = 0;
  total_treasury_fees_ = 0;
  total_treasury_swept_ = 0;
  events_.clear();
  {
    std::lock_guard recent_lock(recent_mutex_);
    recent_snippets_.clear();
  }

  for (const auto& id : language_ids) {
    language_counts_.emplace(id, 0);
  }
}

std::int64_t LedgerService::stamp_now() {
  last_stamp_ms_ = std::max(last_stamp_ms_, clock_());
  return last_stamp_ms_;
}

void LedgerService::append_event(EventPayload payload, std::int64_t unix_ms) {
  LedgerEvent event;
  event.sequence = static_cast<std::uint64_t>(events_.size()) + 1U;
  event.unix_ms = unix_ms;
  event.payload = std::move(payload);
  util::ledger_logger()->debug("event #{} {}", event.sequence, event_kind_name(event_kind(event)));
  events_.push_back(std::move(event));
}

void LedgerService::push_recent(std::uint64_t snippet_id) {
  std::lock_guard recent_lock(recent_mutex_);
  recent_snippets_.push_front(snippet_id);
  while (recent_snippets_.size() > config_.recent_queue_size) {
    recent_snippets_.pop_back();
  }
}

Result LedgerService::reject(std::string_view operation, LedgerError error, std::string message) const {
  util::ledger_logger()->warn("{} rejected [{}]: {}", operation, error_name(error), message);
  return Result::failure(error, std::move(message));
}

bool LedgerService::is_curator(std::string_view caller) const {
  return util::equals_ignore_case(caller, config_.curator);
}

bool LedgerService::is_treasury(std::string_view caller) const {
  return util::equals_ignore_case(caller, config_.treasury);
}

bool LedgerService::is_fulfiller(std::string_view caller) const {
  return util::equals_ignore_case(caller, config_.fulfiller);
}

Result LedgerService::check_live_snippet(std::uint64_t snippet_id) const {
  const auto it = snippets_.find(snippet_id);
  if (it == snippets_.end()) {
    return Result::failure(LedgerError::InvalidSnippetId, "Unknown snippet id " + std::to_string(snippet_id) + ".");
  }
  if (it->second.deleted) {
    return Result::failure(LedgerError::SnippetDeleted, "Snippet " + std::to_string(snippet_id) + " is deleted.");
  }
  return Result::success();
}

std::size_t LedgerService::active_count_locked(std::string_view author) const {
  const auto it = authors_.find(std::string{author});
  if (it == authors_.end()) {
    return 0;
  }
  return static_cast<std::size_t>(std::ranges::count_if(it->second.snippet_ids, [this](std::uint64_t id) {
    const auto found = snippets_.find(id);
    return found != snippets_.end() && !found->second.deleted;
  }));
}

void LedgerService::recompute_reputation(const std::string& author) {
  AuthorState& state = authors_[author];
  std::int64_t total = 0;
  for (const std::uint64_t id : state.snippet_ids) {
    const auto it = snippets_.find(id);
    if (it != snippets_.end() && !it->second.deleted) {
      total += it->second.reputation;
    }
  }
  state.reputation = total;
}

// ---------------------------------------------------------------------------
// Snippets

Result LedgerService::check_submission(const SnippetDraft& draft) const {
  if (paused_) {
    return Result::failure(LedgerError::Paused, "Ledger is paused.");
  }
  if (draft.content.size() > config_.max_snippet_bytes) {
    return Result::failure(LedgerError::SnippetTooLong,
                           "Snippet exceeds " + std::to_string(config_.max_snippet_bytes) + " bytes.");
  }
  if (draft.title.has_value() && draft.title->size() > config_.max_title_bytes) {
    return Result::failure(LedgerError::TitleTooLong,
                           "Title exceeds " + std::to_string(config_.max_title_bytes) + " bytes.");
  }
  if (!language_counts_.contains(draft.language_id)) {
    return Result::failure(LedgerError::LanguageNotRegistered, "Language is not registered.");
  }
  if (active_count_locked(draft.author) >= config_.max_snippets_per_author) {
    return Result::failure(LedgerError::AuthorSnippetCap, "Author reached the active snippet cap.");
  }
  return Result::success();
}

std::uint64_t LedgerService::insert_snippet(const SnippetDraft& draft, std::string content_hash,
                                            std::string title_hash) {
  const std::int64_t now = stamp_now();
  Snippet snippet;
  snippet.snippet_id = next_snippet_id_++;
  snippet.author = draft.author;
  snippet.content_hash = std::move(content_hash);
  snippet.language_id = draft.language_id;
  snippet.title_hash = std::move(title_hash);
  snippet.created_unix_ms = now;
  snippet.updated_unix_ms = now;

  const std::uint64_t id = snippet.snippet_id;
  authors_[draft.author].snippet_ids.push_back(id);
  ++language_counts_[draft.language_id];
  push_recent(id);
  append_event(SnippetSubmittedEvent{id, snippet.author, snippet.content_hash, snippet.language_id, now}, now);
  snippets_.emplace(id, std::move(snippet));
  return id;
}

Result LedgerService::submit_snippet(const SnippetDraft& draft, std::uint64_t& out_snippet_id) {
  std::string content_hash = hasher_(draft.content);
  std::string title_hash = draft.title.has_value() ? hasher_(*draft.title) : std::string{};

  std::lock_guard lock(mutex_);
  if (const Result checked = check_submission(draft); !checked.ok) {
    return reject("submit_snippet", checked.error, checked.message);
  }

  out_snippet_id = insert_snippet(draft, std::move(content_hash), std::move(title_hash));
  util::ledger_logger()->debug("snippet {} submitted by {}", out_snippet_id, draft.author);
  return Result::success("Snippet submitted.", std::to_string(out_snippet_id));
}

Result LedgerService::update_snippet(std::uint64_t snippet_id, std::string_view author,
                                     std::string_view new_content) {
  std::string content_hash = hasher_(new_content);

  std::lock_guard lock(mutex_);
  if (paused_) {
    return reject("update_snippet", LedgerError::Paused, "Ledger is paused.");
  }
  if (const Result live = check_live_snippet(snippet_id); !live.ok) {
    return reject("update_snippet", live.error, live.message);
  }
  Snippet& snippet = snippets_.at(snippet_id);
  if (snippet.author != author) {
    return reject("update_snippet", LedgerError::NotAuthor, "Only the author may update a snippet.");
  }
  if (new_content.size() > config_.max_snippet_bytes) {
    return reject("update_snippet", LedgerError::SnippetTooLong,
                  "Snippet exceeds " + std::to_string(config_.max_snippet_bytes) + " bytes.");
  }

  const std::int64_t now = stamp_now();
  snippet.content_hash = std::move(content_hash);
  snippet.updated_unix_ms = now;
  append_event(SnippetUpdatedEvent{snippet_id, snippet.author, snippet.content_hash, now}, now);
  return Result::success("Snippet updated.", snippet.content_hash);
}

Result LedgerService::delete_snippet(std::uint64_t snippet_id, std::string_view author) {
  std::lock_guard lock(mutex_);
  if (const Result live = check_live_snippet(snippet_id); !live.ok) {
    return reject("delete_snippet", live.error, live.message);
  }
  Snippet& snippet = snippets_.at(snippet_id);
  if (snippet.author != author) {
    return reject("delete_snippet", LedgerError::NotAuthor, "Only the author may delete a snippet.");
  }

  snippet.deleted = true;
  auto& count = language_counts_[snippet.language_id];
  if (count > 0) {
    --count;
  }
  recompute_reputation(snippet.author);
  append_event(SnippetDeletedEvent{snippet_id, snippet.author}, stamp_now());
  return Result::success("Snippet deleted.");
}

Result LedgerService::add_snippet_tag(std::uint64_t snippet_id, std::string_view tag_hash,
                                      std::string_view author) {
  std::lock_guard lock(mutex_);
  if (const Result live = check_live_snippet(snippet_id); !live.ok) {
    return reject("add_snippet_tag", live.error, live.message);
  }
  Snippet& snippet = snippets_.at(snippet_id);
  if (snippet.author != author) {
    return reject("add_snippet_tag", LedgerError::NotAuthor, "Only the author may tag a snippet.");
  }
  if (snippet.tags.size() >= config_.max_tags_per_snippet) {
    return Result::success("Tag limit reached; tag ignored.");
  }
  if (std::find(snippet.tags.begin(), snippet.tags.end(), tag_hash) != snippet.tags.end()) {
    return Result::success("Tag already present.");
  }

  snippet.tags.emplace_back(tag_hash);
  append_event(SnippetTaggedEvent{snippet_id, std::string{tag_hash}}, stamp_now());
  return Result::success("Tag added.");
}

Result LedgerService::submit_snippet_batch(std::string_view author, const std::vector<std::string>& contents,
                                           const std::vector<std::optional<std::string>>& titles,
                                           std::string_view language_id, BatchSubmitReport& out_report) {
  out_report = {};
  std::size_t max_batch = 0;
  {
    std::lock_guard lock(mutex_);
    max_batch = config_.max_submit_batch;
  }
  if (contents.size() > max_batch) {
    return reject("submit_snippet_batch", LedgerError::BatchTooLarge,
                  "At most " + std::to_string(max_batch) + " snippets per batch.");
  }
  if (titles.size() != contents.size()) {
    return reject("submit_snippet_batch", LedgerError::BatchLengthMismatch,
                  "Contents and titles must have the same length.");
  }

  for (std::size_t i = 0; i < contents.size(); ++i) {
    std::uint64_t id = 0;
    const Result submitted = submit_snippet(
        {.author = std::string{author}, .content = contents[i], .language_id = std::string{language_id},
         .title = titles[i]},
        id);
    if (!submitted.ok) {
      out_report.stopped_by = submitted.error;
      out_report.stopped_at = i;
      out_report.stop_message = submitted.message;
      break;
    }
    out_report.snippet_ids.push_back(id);
  }

  return Result::success("Submitted " + std::to_string(out_report.snippet_ids.size()) + " of " +
                         std::to_string(contents.size()) + " snippets.");
}

// ---------------------------------------------------------------------------
// Tips and treasury

Result LedgerService::check_tip(std::uint64_t snippet_id, const Amount& amount) const {
  if (paused_) {
    return Result::failure(LedgerError::Paused, "Ledger is paused.");
  }
  if (amount < config_.min_tip_units) {
    return Result::failure(LedgerError::TipTooSmall,
                           "Tips must be at least " + std::to_string(config_.min_tip_units) + " units.");
  }
  return check_live_snippet(snippet_id);
}

TipReceipt LedgerService::apply_tip(std::uint64_t snippet_id, std::string_view tipper, const Amount& amount) {
  TipReceipt receipt;
  receipt.snippet_id = snippet_id;
  receipt.amount = amount;
  receipt.fee = amount * config_.treasury_fee_bps / config_.bps_denominator;
  receipt.to_author = amount - receipt.fee;

  Snippet& snippet = snippets_.at(snippet_id);
  snippet.tip_balance += receipt.to_author;
  authors_[snippet.author].withdrawable += receipt.to_author;
  total_tips_received_ += amount;
  total_treasury_fees_ += receipt.fee;

  append_event(SnippetTippedEvent{snippet_id, std::string{tipper}, amount, receipt.to_author, receipt.fee},
               stamp_now());
  return receipt;
}

Result LedgerService::tip_snippet(std::uint64_t snippet_id, std::string_view tipper, const Amount& amount,
                                  TipReceipt& out_receipt) {
  std::lock_guard lock(mutex_);
  if (const Result checked = check_tip(snippet_id, amount); !checked.ok) {
    return reject("tip_snippet", checked.error, checked.message);
  }

  out_receipt = apply_tip(snippet_id, tipper, amount);
  util::ledger_logger()->debug("snippet {} tipped {} by {}", snippet_id, out_receipt.amount.str(), tipper);
  return Result::success("Snippet tipped.", out_receipt.to_author.str());
}

Result LedgerService::tip_snippet_batch(std::string_view tipper, const std::vector<std::uint64_t>& snippet_ids,
                                        const std::vector<Amount>& amounts,
                                        std::vector<TipReceipt>& out_receipts) {
  out_receipts.clear();
  std::size_t max_batch = 0;
  {
    std::lock_guard lock(mutex_);
    max_batch = config_.max_tip_batch;
  }
  if (snippet_ids.size() > max_batch) {
    return reject("tip_snippet_batch", LedgerError::BatchTooLarge,
                  "At most " + std::to_string(max_batch) + " tips per batch.");
  }
  if (amounts.size() != snippet_ids.size()) {
    return reject("tip_snippet_batch", LedgerError::BatchLengthMismatch,
                  "Snippet ids and amounts must have the same length.");
  }

  for (std::size_t i = 0; i < snippet_ids.size(); ++i) {
    TipReceipt receipt;
    const Result tipped = tip_snippet(snippet_ids[i], tipper, amounts[i], receipt);
    if (!tipped.ok) {
      return tipped;
    }
    out_receipts.push_back(std::move(receipt));
  }
  return Result::success("Tipped " + std::to_string(out_receipts.size()) + " snippets.");
}

Result LedgerService::withdraw_tips(std::string_view author, Amount& out_amount) {
  std::lock_guard lock(mutex_);
  const auto it = authors_.find(std::string{author});
  if (it == authors_.end() || it->second.withdrawable <= 0) {
    return reject("withdraw_tips", LedgerError::InsufficientBalance, "No tips to withdraw.");
  }

  out_amount = it->second.withdrawable;
  it->second.withdrawable = 0;
  total_tips_withdrawn_ += out_amount;
  append_event(TipsWithdrawnEvent{std::string{author}, out_amount}, stamp_now());
  util::ledger_logger()->debug("{} withdrew {}", author, out_amount.str());
  return Result::success("Tips withdrawn.", out_amount.str());
}

Result LedgerService::sweep_treasury(std::string_view treasury, Amount& out_amount) {
  std::lock_guard lock(mutex_);
  if (!is_treasury(treasury)) {
    return reject("sweep_treasury", LedgerError::TreasuryOnly, "Only the treasury may sweep fees.");
  }
  const Amount pending = total_treasury_fees_ - total_treasury_swept_;
  if (pending <= 0) {
    return reject("sweep_treasury", LedgerError::InsufficientBalance, "No treasury fees pending.");
  }

  out_amount = pending;
  total_treasury_swept_ += pending;
  append_event(TreasurySweptEvent{std::string{treasury}, pending}, stamp_now());
  return Result::success("Treasury fees swept.", pending.str());
}

// ---------------------------------------------------------------------------
// Hints

Result LedgerService::request_hint(std::string_view requester, std::string_view topic_hash,
                                   std::uint64_t snippet_id, std::uint64_t& out_hint_id) {
  std::lock_guard lock(mutex_);
  if (paused_) {
    return reject("request_hint", LedgerError::Paused, "Ledger is paused.");
  }

  const std::string requester_key{requester};
  std::size_t open_count = 0;
  if (const auto it = hints_by_requester_.find(requester_key); it != hints_by_requester_.end()) {
    open_count = static_cast<std::size_t>(std::ranges::count_if(it->second, [this](std::uint64_t id) {
      return !hints_.at(id).fulfilled;
    }));
  }
  if (open_count >= config_.max_open_hints_per_user) {
    return reject("request_hint", LedgerError::HintRequestCap, "Requester has too many open hints.");
  }
  if (snippet_id != 0) {
    if (const Result live = check_live_snippet(snippet_id); !live.ok) {
      return reject("request_hint", live.error, live.message);
    }
  }

  HintRequest request;
  request.hint_id = next_hint_id_++;
  request.requester = requester_key;
  request.topic_hash = std::string{topic_hash};
  request.snippet_id = snippet_id;
  request.created_unix_ms = stamp_now();

  out_hint_id = request.hint_id;
  hints_by_requester_[requester_key].push_back(out_hint_id);
  append_event(HintRequestedEvent{out_hint_id, request.requester, request.topic_hash, snippet_id},
               request.created_unix_ms);
  hints_.emplace(out_hint_id, std::move(request));
  return Result::success("Hint requested.", std::to_string(out_hint_id));
}

Result LedgerService::fulfill_hint(std::uint64_t hint_id, std::string_view fulfiller) {
  std::lock_guard lock(mutex_);
  if (!is_fulfiller(fulfiller)) {
    return reject("fulfill_hint", LedgerError::FulfillerOnly, "Only the fulfiller may fulfil hints.");
  }
  if (paused_) {
    return reject("fulfill_hint", LedgerError::Paused, "Ledger is paused.");
  }
  const auto it = hints_.find(hint_id);
  if (it == hints_.end()) {
    return reject("fulfill_hint", LedgerError::InvalidHintId, "Unknown hint id " + std::to_string(hint_id) + ".");
  }
  if (it->second.fulfilled) {
    return reject("fulfill_hint", LedgerError::HintAlreadyFulfilled,
                  "Hint " + std::to_string(hint_id) + " is already fulfilled.");
  }

  HintRequest& request = it->second;
  request.fulfilled = true;
  request.fulfiller = std::string{fulfiller};
  request.fulfilled_unix_ms = stamp_now();
  append_event(HintFulfilledEvent{hint_id, request.fulfiller, request.fulfilled_unix_ms},
               request.fulfilled_unix_ms);
  return Result::success("Hint fulfilled.");
}

// ---------------------------------------------------------------------------
// Curation

Result LedgerService::register_language(std::string_view language_id, std::string_view curator) {
  std::lock_guard lock(mutex_);
  if (!is_curator(curator)) {
    return reject("register_language", LedgerError::CuratorOnly, "Only the curator may register languages.");
  }
  const auto [it, inserted] = language_counts_.emplace(std::string{language_id}, 0);
  if (!inserted) {
    return reject("register_language", LedgerError::LanguageAlreadyRegistered, "Language is already registered.");
  }

  append_event(LanguageRegisteredEvent{it->first}, stamp_now());
  return Result::success("Language registered.");
}

Result LedgerService::set_paused(bool paused, std::string_view curator) {
  std::lock_guard lock(mutex_);
  if (!is_curator(curator)) {
    return reject("set_paused", LedgerError::CuratorOnly, "Only the curator may pause the ledger.");
  }

  paused_ = paused;
  append_event(PauseToggledEvent{paused}, stamp_now());
  util::ledger_logger()->info("ledger {}", paused ? "paused" : "resumed");
  return Result::success(paused ? "Ledger paused." : "Ledger resumed.");
}

Result LedgerService::award_badge(std::string_view account, std::uint32_t slot, std::string_view curator) {
  std::lock_guard lock(mutex_);
  if (!is_curator(curator)) {
    return reject("award_badge", LedgerError::CuratorOnly, "Only the curator may award badges.");
  }
  if (slot >= config_.badge_slots) {
    return Result::success("Badge slot out of range; nothing awarded.");
  }

  const auto bit = static_cast<std::uint8_t>(1U << slot);
  AuthorState& state = authors_[std::string{account}];
  if ((state.badges & bit) != 0) {
    return Result::success("Badge already held.");
  }
  state.badges = static_cast<std::uint8_t>(state.badges | bit);
  append_event(BadgeAwardedEvent{std::string{account}, slot}, stamp_now());
  return Result::success("Badge awarded.");
}

// ---------------------------------------------------------------------------
// Votes

Result LedgerService::cast_vote(std::uint64_t snippet_id, std::string_view voter, VoteDirection direction,
                                std::int64_t& out_score) {
  const char* operation = direction == VoteDirection::Up ? "upvote_snippet" : "downvote_snippet";
  if (paused_) {
    return reject(operation, LedgerError::Paused, "Ledger is paused.");
  }
  if (const Result live = check_live_snippet(snippet_id); !live.ok) {
    return reject(operation, live.error, live.message);
  }
  Snippet& snippet = snippets_.at(snippet_id);
  if (snippet.author == voter) {
    return reject(operation, LedgerError::CannotVoteOwn, "Authors cannot vote on their own snippets.");
  }

  VoterState& state = voters_[std::string{voter}];
  auto& same = direction == VoteDirection::Up ? state.upvoted : state.downvoted;
  auto& opposite = direction == VoteDirection::Up ? state.downvoted : state.upvoted;
  if (same.contains(snippet_id)) {
    return direction == VoteDirection::Up
               ? reject(operation, LedgerError::AlreadyUpvoted, "Snippet already upvoted.")
               : reject(operation, LedgerError::AlreadyDownvoted, "Snippet already downvoted.");
  }

  const std::int64_t up = config_.reputation_up_delta;
  const std::int64_t down = config_.reputation_down_delta;
  if (opposite.erase(snippet_id) > 0) {
    snippet.reputation = clamp_at_zero(direction == VoteDirection::Up ? snippet.reputation + down
                                                                      : snippet.reputation - up);
  }
  snippet.reputation =
      clamp_at_zero(direction == VoteDirection::Up ? snippet.reputation + up : snippet.reputation - down);
  same.insert(snippet_id);
  recompute_reputation(snippet.author);

  out_score = snippet.reputation;
  const std::int64_t now = stamp_now();
  if (direction == VoteDirection::Up) {
    append_event(ReputationUpvoteEvent{snippet_id, std::string{voter}, out_score}, now);
  } else {
    append_event(ReputationDownvoteEvent{snippet_id, std::string{voter}, out_score}, now);
  }
  return Result::success("Vote recorded.", std::to_string(out_score));
}

Result LedgerService::upvote_snippet(std::uint64_t snippet_id, std::string_view voter, std::int64_t& out_score) {
  std::lock_guard lock(mutex_);
  return cast_vote(snippet_id, voter, VoteDirection::Up, out_score);
}

Result LedgerService::downvote_snippet(std::uint64_t snippet_id, std::string_view voter,
                                       std::int64_t& out_score) {
  std::lock_guard lock(mutex_);
  return cast_vote(snippet_id, voter, VoteDirection::Down, out_score);
}

// ---------------------------------------------------------------------------
// Reads

std::optional<Snippet> LedgerService::snippet(std::uint64_t snippet_id) const {
  std::lock_guard lock(mutex_);
  const auto it = snippets_.find(snippet_id);
  if (it == snippets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<HintRequest> LedgerService::hint(std::uint64_t hint_id) const {
  std::lock_guard lock(mutex_);
  const auto it = hints_.find(hint_id);
  if (it == hints_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Amount LedgerService::tip_balance(std::string_view author) const {
  std::lock_guard lock(mutex_);
  const auto it = authors_.find(std::string{author});
  return it == authors_.end() ? Amount{0} : it->second.withdrawable;
}

std::int64_t LedgerService::reputation(std::string_view author) const {
  std::lock_guard lock(mutex_);
  const auto it = authors_.find(std::string{author});
  return it == authors_.end() ? 0 : it->second.reputation;
}

std::uint8_t LedgerService::badges(std::string_view account) const {
  std::lock_guard lock(mutex_);
  const auto it = authors_.find(std::string{account});
  return it == authors_.end() ? 0 : it->second.badges;
}

bool LedgerService::has_badge(std::string_view account, std::uint32_t slot) const {
  if (slot >= 8) {
    return false;
  }
  return (badges(account) & (1U << slot)) != 0;
}

std::vector<std::uint64_t> LedgerService::snippets_by_author(std::string_view author) const {
  std::lock_guard lock(mutex_);
  std::vector<std::uint64_t> ids;
  const auto it = authors_.find(std::string{author});
  if (it == authors_.end()) {
    return ids;
  }
  for (const std::uint64_t id : it->second.snippet_ids) {
    if (!snippets_.at(id).deleted) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::size_t LedgerService::active_snippet_count(std::string_view author) const {
  std::lock_guard lock(mutex_);
  return active_count_locked(author);
}

std::uint64_t LedgerService::language_count(std::string_view language_id) const {
  std::lock_guard lock(mutex_);
  const auto it = language_counts_.find(std::string{language_id});
  return it == language_counts_.end() ? 0 : it->second;
}

bool LedgerService::is_language_registered(std::string_view language_id) const {
  std::lock_guard lock(mutex_);
  return language_counts_.contains(std::string{language_id});
}

std::vector<std::uint64_t> LedgerService::recent_snippet_ids() const {
  std::lock_guard recent_lock(recent_mutex_);
  return {recent_snippets_.begin(), recent_snippets_.end()};
}

std::vector<std::uint64_t> LedgerService::open_hints(std::string_view requester) const {
  std::lock_guard lock(mutex_);
  std::vector<std::uint64_t> ids;
  const auto it = hints_by_requester_.find(std::string{requester});
  if (it == hints_by_requester_.end()) {
    return ids;
  }
  std::ranges::copy_if(it->second, std::back_inserter(ids), [this](std::uint64_t id) {
    return !hints_.at(id).fulfilled;
  });
  return ids;
}

std::vector<std::uint64_t> LedgerService::hints_by_requester(std::string_view requester) const {
  std::lock_guard lock(mutex_);
  const auto it = hints_by_requester_.find(std::string{requester});
  return it == hints_by_requester_.end() ? std::vector<std::uint64_t>{} : it->second;
}

std::vector<std::uint64_t> LedgerService::snippets_by_content_hash(std::string_view content_hash) const {
  std::lock_guard lock(mutex_);
  std::vector<std::uint64_t> ids;
  for (const auto& [id, snippet] : snippets_) {
    if (snippet.content_hash == content_hash) {
      ids.push_back(id);
    }
  }
  std::ranges::sort(ids);
  return ids;
}

std::vector<std::string> LedgerService::snippet_tags(std::uint64_t snippet_id) const {
  std::lock_guard lock(mutex_);
  const auto it = snippets_.find(snippet_id);
  return it == snippets_.end() ? std::vector<std::string>{} : it->second.tags;
}

bool LedgerService::has_upvoted(std::string_view voter, std::uint64_t snippet_id) const {
  std::lock_guard lock(mutex_);
  const auto it = voters_.find(std::string{voter});
  return it != voters_.end() && it->second.upvoted.contains(snippet_id);
}

bool LedgerService::has_downvoted(std::string_view voter, std::uint64_t snippet_id) const {
  std::lock_guard lock(mutex_);
  const auto it = voters_.find(std::string{voter});
  return it != voters_.end() && it->second.downvoted.contains(snippet_id);
}

bool LedgerService::paused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

Amount LedgerService::treasury_pending() const {
  std::lock_guard lock(mutex_);
  return total_treasury_fees_ - total_treasury_swept_;
}

LedgerConfig LedgerService::config() const {
  std::lock_guard lock(mutex_);
  return config_;
}

LedgerStats LedgerService::stats() const {
  std::lock_guard lock(mutex_);
  LedgerStats report;
  report.total_tips_received = total_tips_received_;
  report.total_tips_withdrawn = total_tips_withdrawn_;
  report.total_treasury_fees = total_treasury_fees_;
  report.total_treasury_swept = total_treasury_swept_;
  report.snippet_count = next_snippet_id_ - 1U;
  report.hint_count = next_hint_id_ - 1U;
  report.registered_language_count = language_counts_.size();
  report.event_count = events_.size();
  report.paused = paused_;
  return report;
}

std::vector<LedgerEvent> LedgerService::events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

std::size_t LedgerService::event_count() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

}  // namespace pawledger

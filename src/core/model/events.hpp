#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "core/model/types.hpp"

namespace pawledger {

enum class EventKind {
  SnippetSubmitted,
  SnippetUpdated,
  SnippetDeleted,
  SnippetTipped,
  TipsWithdrawn,
  HintRequested,
  HintFulfilled,
  LanguageRegistered,
  ReputationUpvote,
  ReputationDownvote,
  PauseToggled,
  BadgeAwarded,
  SnippetTagged,
  TreasurySwept,
};

struct SnippetSubmittedEvent {
  std::uint64_t snippet_id = 0;
  std::string author;
  std::string content_hash;
  std::string language_id;
  std::int64_t created_unix_ms = 0;
};

struct SnippetUpdatedEvent {
  std::uint64_t snippet_id = 0;
  std::string author;
  std::string new_content_hash;
  std::int64_t updated_unix_ms = 0;
};

struct SnippetDeletedEvent {
  std::uint64_t snippet_id = 0;
  std::string author;
};

struct SnippetTippedEvent {
  std::uint64_t snippet_id = 0;
  std::string tipper;
  Amount amount = 0;
  Amount to_author = 0;
  Amount to_treasury = 0;
};

struct TipsWithdrawnEvent {
  std::string author;
  Amount amount = 0;
};

struct HintRequestedEvent {
  std::uint64_t hint_id = 0;
  std::string requester;
  std::string topic_hash;
  std::uint64_t snippet_id = 0;
};

struct HintFulfilledEvent {
  std::uint64_t hint_id = 0;
  std::string fulfiller;
  std::int64_t fulfilled_unix_ms = 0;
};

struct LanguageRegisteredEvent {
  std::string language_id;
};

struct ReputationUpvoteEvent {
  std::uint64_t snippet_id = 0;
  std::string voter;
  std::int64_t new_score = 0;
};

struct ReputationDownvoteEvent {
  std::uint64_t snippet_id = 0;
  std::string voter;
  std::int64_t new_score = 0;
};

struct PauseToggledEvent {
  bool paused = false;
};

struct BadgeAwardedEvent {
  std::string account;
  std::uint32_t slot = 0;
};

struct SnippetTaggedEvent {
  std::uint64_t snippet_id = 0;
  std::string tag_hash;
};

struct TreasurySweptEvent {
  std::string treasury;
  Amount amount = 0;
};

using EventPayload =
    std::variant<SnippetSubmittedEvent, SnippetUpdatedEvent, SnippetDeletedEvent, SnippetTippedEvent,
                 TipsWithdrawnEvent, HintRequestedEvent, HintFulfilledEvent, LanguageRegisteredEvent,
                 ReputationUpvoteEvent, ReputationDownvoteEvent, PauseToggledEvent, BadgeAwardedEvent,
                 SnippetTaggedEvent, TreasurySweptEvent>;

// One entry of the append-only audit log. Sequence numbers start at 1.
struct LedgerEvent {
  std::uint64_t sequence = 0;
  std::int64_t unix_ms = 0;
  EventPayload payload;
};

EventKind event_kind(const LedgerEvent& event);
std::string_view event_kind_name(EventKind kind);

// Sorted key=value rendering of the event, one field per line.
std::string event_payload(const LedgerEvent& event);

}  // namespace pawledger

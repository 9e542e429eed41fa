#include "core/model/events.hpp"

#include <type_traits>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"

namespace pawledger {
namespace {

using Fields = std::vector<std::pair<std::string, std::string>>;

std::string amount_text(const Amount& amount) {
  return amount.str();
}

Fields event_fields(const EventPayload& payload) {
  return std::visit(
      [](const auto& e) -> Fields {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SnippetSubmittedEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)},
                  {"author", e.author},
                  {"content_hash", e.content_hash},
                  {"language_id", e.language_id},
                  {"created_unix_ms", std::to_string(e.created_unix_ms)}};
        } else if constexpr (std::is_same_v<T, SnippetUpdatedEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)},
                  {"author", e.author},
                  {"new_content_hash", e.new_content_hash},
                  {"updated_unix_ms", std::to_string(e.updated_unix_ms)}};
        } else if constexpr (std::is_same_v<T, SnippetDeletedEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)}, {"author", e.author}};
        } else if constexpr (std::is_same_v<T, SnippetTippedEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)},
                  {"tipper", e.tipper},
                  {"amount", amount_text(e.amount)},
                  {"to_author", amount_text(e.to_author)},
                  {"to_treasury", amount_text(e.to_treasury)}};
        } else if constexpr (std::is_same_v<T, TipsWithdrawnEvent>) {
          return {{"author", e.author}, {"amount", amount_text(e.amount)}};
        } else if constexpr (std::is_same_v<T, HintRequestedEvent>) {
          return {{"hint_id", std::to_string(e.hint_id)},
                  {"requester", e.requester},
                  {"topic_hash", e.topic_hash},
                  {"snippet_id", std::to_string(e.snippet_id)}};
        } else if constexpr (std::is_same_v<T, HintFulfilledEvent>) {
          return {{"hint_id", std::to_string(e.hint_id)},
                  {"fulfiller", e.fulfiller},
                  {"fulfilled_unix_ms", std::to_string(e.fulfilled_unix_ms)}};
        } else if constexpr (std::is_same_v<T, LanguageRegisteredEvent>) {
          return {{"language_id", e.language_id}};
        } else if constexpr (std::is_same_v<T, ReputationUpvoteEvent> ||
                             std::is_same_v<T, ReputationDownvoteEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)},
                  {"voter", e.voter},
                  {"new_score", std::to_string(e.new_score)}};
        } else if constexpr (std::is_same_v<T, PauseToggledEvent>) {
          return {{"paused", e.paused ? "1" : "0"}};
        } else if constexpr (std::is_same_v<T, BadgeAwardedEvent>) {
          return {{"account", e.account}, {"slot", std::to_string(e.slot)}};
        } else if constexpr (std::is_same_v<T, SnippetTaggedEvent>) {
          return {{"snippet_id", std::to_string(e.snippet_id)}, {"tag_hash", e.tag_hash}};
        } else {
          static_assert(std::is_same_v<T, TreasurySweptEvent>);
          return {{"treasury", e.treasury}, {"amount", amount_text(e.amount)}};
        }
      },
      payload);
}

}  // namespace

EventKind event_kind(const LedgerEvent& event) {
  // Variant alternatives are declared in EventKind order.
  return static_cast<EventKind>(event.payload.index());
}

std::string_view event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::SnippetSubmitted:
      return "SnippetSubmitted";
    case EventKind::SnippetUpdated:
      return "SnippetUpdated";
    case EventKind::SnippetDeleted:
      return "SnippetDeleted";
    case EventKind::SnippetTipped:
      return "SnippetTipped";
    case EventKind::TipsWithdrawn:
      return "TipsWithdrawn";
    case EventKind::HintRequested:
      return "HintRequested";
    case EventKind::HintFulfilled:
      return "HintFulfilled";
    case EventKind::LanguageRegistered:
      return "LanguageRegistered";
    case EventKind::ReputationUpvote:
      return "ReputationUpvote";
    case EventKind::ReputationDownvote:
      return "ReputationDownvote";
    case EventKind::PauseToggled:
      return "PauseToggled";
    case EventKind::BadgeAwarded:
      return "BadgeAwarded";
    case EventKind::SnippetTagged:
      return "SnippetTagged";
    case EventKind::TreasurySwept:
      return "TreasurySwept";
  }
  return "Unknown";
}

std::string event_payload(const LedgerEvent& event) {
  Fields fields = event_fields(event.payload);
  fields.emplace_back("kind", std::string{event_kind_name(event_kind(event))});
  fields.emplace_back("sequence", std::to_string(event.sequence));
  fields.emplace_back("unix_ms", std::to_string(event.unix_ms));
  return util::canonical_join(std::move(fields));
}

}  // namespace pawledger

#include "core/model/types.hpp"

namespace pawledger {

const char* error_name(LedgerError error) {
  switch (error) {
    case LedgerError::None:
      return "None";
    case LedgerError::CuratorOnly:
      return "CuratorOnly";
    case LedgerError::TreasuryOnly:
      return "TreasuryOnly";
    case LedgerError::FulfillerOnly:
      return "FulfillerOnly";
    case LedgerError::Paused:
      return "Paused";
    case LedgerError::SnippetTooLong:
      return "SnippetTooLong";
    case LedgerError::TitleTooLong:
      return "TitleTooLong";
    case LedgerError::InvalidSnippetId:
      return "InvalidSnippetId";
    case LedgerError::SnippetDeleted:
      return "SnippetDeleted";
    case LedgerError::NotAuthor:
      return "NotAuthor";
    case LedgerError::AuthorSnippetCap:
      return "AuthorSnippetCap";
    case LedgerError::HintRequestCap:
      return "HintRequestCap";
    case LedgerError::InvalidHintId:
      return "InvalidHintId";
    case LedgerError::HintAlreadyFulfilled:
      return "HintAlreadyFulfilled";
    case LedgerError::TipTooSmall:
      return "TipTooSmall";
    case LedgerError::InsufficientBalance:
      return "InsufficientBalance";
    case LedgerError::LanguageNotRegistered:
      return "LanguageNotRegistered";
    case LedgerError::LanguageAlreadyRegistered:
      return "LanguageAlreadyRegistered";
    case LedgerError::AlreadyUpvoted:
      return "AlreadyUpvoted";
    case LedgerError::AlreadyDownvoted:
      return "AlreadyDownvoted";
    case LedgerError::CannotVoteOwn:
      return "CannotVoteOwn";
    case LedgerError::ZeroAddress:
      return "ZeroAddress";
    case LedgerError::BatchTooLarge:
      return "BatchTooLarge";
    case LedgerError::BatchLengthMismatch:
      return "BatchLengthMismatch";
    case LedgerError::InvalidConfig:
      return "InvalidConfig";
    case LedgerError::ConfigUnreadable:
      return "ConfigUnreadable";
  }
  return "Unknown";
}

}  // namespace pawledger

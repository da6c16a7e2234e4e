#include "core/model/types.hpp"

#include <array>

namespace hogpen {
namespace {

constexpr std::array<std::pair<GameSource, std::string_view>, 7> kSourceNames = {{
    {GameSource::CardDuel, "blackjack"},
    {GameSource::Reel, "slots"},
    {GameSource::Wheel, "roulette"},
    {GameSource::Ladder, "ride_the_bus"},
    {GameSource::Loan, "loan"},
    {GameSource::Beg, "beg"},
    {GameSource::Admin, "admin"},
}};

constexpr std::array<std::pair<UpdateKind, std::string_view>, 12> kKindNames = {{
    {UpdateKind::AccountOpened, "account_opened"},
    {UpdateKind::BetPlaced, "bet_placed"},
    {UpdateKind::BetWon, "bet_won"},
    {UpdateKind::BetLost, "bet_lost"},
    {UpdateKind::BetPush, "bet_push"},
    {UpdateKind::RoundWon, "round_won"},
    {UpdateKind::LoanSent, "loan_sent"},
    {UpdateKind::LoanReceived, "loan_received"},
    {UpdateKind::BegReceived, "beg_received"},
    {UpdateKind::AdminAdjustment, "admin_adjustment"},
    {UpdateKind::Refund, "refund"},
    {UpdateKind::CrashRefund, "crash_refund"},
}};

}  // namespace

std::string_view error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::InsufficientFunds:
      return "insufficient_funds";
    case ErrorCode::AccountNotFound:
      return "account_not_found";
    case ErrorCode::AlreadyActive:
      return "already_active";
    case ErrorCode::NoActiveGame:
      return "no_active_game";
    case ErrorCode::StorageConflict:
      return "storage_conflict";
    case ErrorCode::StorageTimeout:
      return "storage_timeout";
    case ErrorCode::StorageIo:
      return "storage_io";
    case ErrorCode::CrashDetected:
      return "crash_detected";
    case ErrorCode::ValidationError:
      return "validation_error";
    case ErrorCode::RateLimited:
      return "rate_limited";
    case ErrorCode::Internal:
      return "internal";
  }
  return "internal";
}

std::string_view game_source_name(GameSource source) {
  for (const auto& [value, name] : kSourceNames) {
    if (value == source) {
      return name;
    }
  }
  return "admin";
}

std::optional<GameSource> game_source_from_name(std::string_view name) {
  for (const auto& [value, text] : kSourceNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::string_view update_kind_name(UpdateKind kind) {
  for (const auto& [value, name] : kKindNames) {
    if (value == kind) {
      return name;
    }
  }
  return "admin_adjustment";
}

std::optional<UpdateKind> update_kind_from_name(std::string_view name) {
  for (const auto& [value, text] : kKindNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

std::string_view session_status_name(SessionStatus status) {
  switch (status) {
    case SessionStatus::Active:
      return "active";
    case SessionStatus::Finished:
      return "finished";
    case SessionStatus::Crashed:
      return "crashed";
  }
  return "active";
}

std::optional<SessionStatus> session_status_from_name(std::string_view name) {
  if (name == "active") {
    return SessionStatus::Active;
  }
  if (name == "finished") {
    return SessionStatus::Finished;
  }
  if (name == "crashed") {
    return SessionStatus::Crashed;
  }
  return std::nullopt;
}

bool is_resolved_kind(UpdateKind kind) {
  return kind != UpdateKind::BetPlaced && kind != UpdateKind::RoundWon;
}

bool is_non_game_source(GameSource source) {
  return source == GameSource::Loan || source == GameSource::Beg || source == GameSource::Admin;
}

}  // namespace hogpen

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hogpen {

enum class ErrorCode {
  None,
  InsufficientFunds,
  AccountNotFound,
  AlreadyActive,
  NoActiveGame,
  StorageConflict,
  StorageTimeout,
  StorageIo,
  CrashDetected,
  ValidationError,
  RateLimited,
  Internal,
};

struct Result {
  bool ok = false;
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, ErrorCode::None, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg, ErrorCode code = ErrorCode::Internal) {
    return {false, code, std::move(msg), {}};
  }

  // Transient storage errors; the whole transaction may be replayed.
  [[nodiscard]] bool retryable() const {
    return code == ErrorCode::StorageConflict || code == ErrorCode::StorageTimeout;
  }
};

enum class GameSource {
  CardDuel,
  Reel,
  Wheel,
  Ladder,
  Loan,
  Beg,
  Admin,
};

enum class UpdateKind {
  AccountOpened,
  BetPlaced,
  BetWon,
  BetLost,
  BetPush,
  RoundWon,
  LoanSent,
  LoanReceived,
  BegReceived,
  AdminAdjustment,
  Refund,
  CrashRefund,
};

enum class SessionStatus {
  Active,
  Finished,
  Crashed,
};

using CounterMap = std::map<std::string, std::int64_t>;
using Metadata = std::map<std::string, std::string>;

struct PlayerRef {
  std::string user_id;
  std::string community_id;
};

struct Account {
  std::string user_id;
  std::string community_id;
  std::int64_t balance = 0;
  std::int64_t high_water = 0;
  std::int64_t beg_count = 0;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

struct LedgerEntry {
  std::uint64_t sequence = 0;
  std::string user_id;
  std::string community_id;
  std::int64_t delta = 0;
  std::int64_t balance_after = 0;
  GameSource source = GameSource::Admin;
  UpdateKind kind = UpdateKind::AdminAdjustment;
  Metadata metadata;
  std::int64_t created_at = 0;
  std::string prev_hash;
  std::string entry_hash;
};

struct GameSession {
  std::uint64_t session_id = 0;
  std::string user_id;
  std::string community_id;
  GameSource source = GameSource::CardDuel;
  SessionStatus status = SessionStatus::Active;
  // Outstanding wager: debits for this game not yet resolved.
  std::int64_t bet_amount = 0;
  std::string state_snapshot;
  std::string crash_reason;
  std::int64_t refund_amount = 0;
  std::int64_t created_at = 0;
  std::int64_t updated_at = 0;
};

struct CrashRecord {
  std::uint64_t crash_id = 0;
  std::string user_id;
  std::string community_id;
  GameSource source = GameSource::CardDuel;
  std::uint64_t session_id = 0;
  std::int64_t bet_amount = 0;
  std::int64_t refund_amount = 0;
  std::string crash_reason;
  std::int64_t duration_seconds = 0;
  std::string state_snapshot;
  std::int64_t started_at = 0;
  std::int64_t crashed_at = 0;
};

struct GameStat {
  std::string user_id;
  std::string community_id;
  GameSource source = GameSource::CardDuel;
  std::int64_t played = 0;
  std::int64_t wins = 0;
  std::int64_t losses = 0;
  std::int64_t current_win_streak = 0;
  std::int64_t best_win_streak = 0;
  std::int64_t current_losing_streak = 0;
  std::int64_t worst_losing_streak = 0;
  std::int64_t highest_bet = 0;
  std::int64_t highest_payout = 0;
  std::int64_t highest_loss = 0;
  CounterMap counters;
  std::int64_t updated_at = 0;
};

struct JackpotPool {
  std::string community_id;
  std::int64_t amount = 0;
  std::string last_winner;
  std::int64_t last_won_at = 0;
};

struct LoanRecord {
  std::string lender_id;
  std::string community_id;
  std::int64_t created_at = 0;
};

struct WrappedStats {
  std::int64_t total_games = 0;
  std::int64_t total_won = 0;
  std::int64_t total_lost = 0;
  std::int64_t total_wagered = 0;
  std::int64_t total_winnings = 0;
  std::int64_t net_profit = 0;
  double win_rate = 0.0;
  std::optional<GameSource> favorite_game;
  std::int64_t favorite_game_played = 0;
  std::int64_t biggest_win = 0;
  std::int64_t biggest_loss = 0;
  std::int64_t best_streak = 0;
  std::int64_t worst_streak = 0;
};

struct LeaderboardEntry {
  std::size_t rank = 0;
  std::string user_id;
  std::int64_t balance = 0;
};

struct BetLimits {
  std::int64_t min_bet = 50;
  std::int64_t max_bet = 100000;
};

struct CasinoConfig {
  std::int64_t starting_balance = 10000;
  std::int64_t beg_min = 500;
  std::int64_t beg_max = 1000;
  std::int64_t loan_rate_limit = 3;
  std::int64_t loan_window_seconds = 3600;
  std::int64_t interaction_timeout_seconds = 180;
  std::int64_t crash_margin_seconds = 60;
  std::map<GameSource, std::int64_t> crash_threshold_overrides;
  int dealer_stand_value = 17;
  std::int64_t jackpot_seed = 5000000;
  std::int64_t jackpot_contribution_percent = 100;
  BetLimits card_duel_limits{.min_bet = 50, .max_bet = 100000};
  BetLimits reel_limits{.min_bet = 50, .max_bet = 10000};
  BetLimits wheel_limits{.min_bet = 50, .max_bet = 100000};
  BetLimits ladder_limits{.min_bet = 50, .max_bet = 100000};
  std::size_t wheel_max_bets = 30;
  std::size_t history_default = 100;
  std::size_t history_min = 2;
  std::size_t history_max = 1000;
  std::int64_t prune_keep_days = 7;
  int storage_retry_attempts = 3;
  std::string log_level = "info";

  [[nodiscard]] std::int64_t crash_threshold_seconds(GameSource source) const {
    const auto it = crash_threshold_overrides.find(source);
    if (it != crash_threshold_overrides.end()) {
      return it->second;
    }
    return interaction_timeout_seconds + crash_margin_seconds;
  }

  [[nodiscard]] const BetLimits& limits_for(GameSource source) const {
    switch (source) {
      case GameSource::Reel:
        return reel_limits;
      case GameSource::Wheel:
        return wheel_limits;
      case GameSource::Ladder:
        return ladder_limits;
      default:
        return card_duel_limits;
    }
  }

  [[nodiscard]] std::int64_t smallest_min_bet() const {
    std::int64_t smallest = card_duel_limits.min_bet;
    for (const BetLimits* limits : {&reel_limits, &wheel_limits, &ladder_limits}) {
      smallest = std::min(smallest, limits->min_bet);
    }
    return smallest;
  }
};

struct StoreHealthReport {
  bool healthy = false;
  std::size_t account_count = 0;
  std::size_t ledger_entry_count = 0;
  std::size_t session_count = 0;
  std::size_t active_session_count = 0;
  std::size_t crash_record_count = 0;
  std::size_t stat_count = 0;
  std::size_t jackpot_count = 0;
  std::size_t committed_batches = 0;
  std::size_t dropped_records = 0;
  std::uintmax_t journal_bytes = 0;
  bool recovered_from_corruption = false;
  std::string details;
};

std::string_view error_code_name(ErrorCode code);
std::string_view game_source_name(GameSource source);
std::optional<GameSource> game_source_from_name(std::string_view name);
std::string_view update_kind_name(UpdateKind kind);
std::optional<UpdateKind> update_kind_from_name(std::string_view name);
std::string_view session_status_name(SessionStatus status);
std::optional<SessionStatus> session_status_from_name(std::string_view name);

// Every kind except bet placement and intermediate round wins.
bool is_resolved_kind(UpdateKind kind);

// Money sources that are not gambling outcomes.
bool is_non_game_source(GameSource source);

}  // namespace hogpen

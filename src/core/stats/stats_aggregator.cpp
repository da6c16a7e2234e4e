#include "core/stats/stats_aggregator.hpp"

#include <algorithm>
#include <cstdlib>
#include <ranges>

#include "core/util/log.hpp"

namespace hogpen {
namespace {

void merge_counters(CounterMap& into, const CounterMap& counters) {
  for (const auto& [key, value] : counters) {
    into[key] += value;
  }
}

}  // namespace

void apply_game_result(GameStat& stat, bool won, std::int64_t bet, std::int64_t payout, const CounterMap& counters) {
  ++stat.played;
  if (won) {
    ++stat.wins;
    ++stat.current_win_streak;
    stat.current_losing_streak = 0;
    stat.highest_payout = std::max(stat.highest_payout, payout);
  } else {
    ++stat.losses;
    ++stat.current_losing_streak;
    stat.current_win_streak = 0;
    stat.highest_loss = std::max(stat.highest_loss, bet);
  }
  stat.best_win_streak = std::max(stat.best_win_streak, stat.current_win_streak);
  stat.worst_losing_streak = std::max(stat.worst_losing_streak, stat.current_losing_streak);
  stat.highest_bet = std::max(stat.highest_bet, bet);
  merge_counters(stat.counters, counters);
}

StatsAggregator::StatsAggregator(Store& store, const CasinoConfig& config, const util::Clock& clock)
    : store_(store), config_(config), clock_(clock) {}

GameStat StatsAggregator::load_or_new(Store::Transaction& txn, const PlayerRef& player, GameSource source) const {
  if (auto existing = txn.stat(player.user_id, player.community_id, source); existing.has_value()) {
    return *existing;
  }
  GameStat fresh;
  fresh.user_id = player.user_id;
  fresh.community_id = player.community_id;
  fresh.source = source;
  return fresh;
}

Result StatsAggregator::record(Store::Transaction& txn, const PlayerRef& player, GameSource source, bool won,
                               std::int64_t bet, std::int64_t payout, const CounterMap& extra) {
  if (bet < 0 || payout < 0) {
    return Result::failure("Stat amounts must not be negative.", ErrorCode::ValidationError);
  }

  GameStat stat = load_or_new(txn, player, source);
  apply_game_result(stat, won, bet, payout, extra);
  stat.updated_at = clock_.now();
  txn.put_stat(stat);

  util::log_debug("stats", player.user_id + "@" + player.community_id + " " +
                               std::string{game_source_name(source)} + (won ? " WIN" : " LOSS"));
  return Result::success();
}

Result StatsAggregator::record(const PlayerRef& player, GameSource source, bool won, std::int64_t bet,
                               std::int64_t payout, const CounterMap& extra) {
  return store_.run(
      [&](Store::Transaction& txn) { return record(txn, player, source, won, bet, payout, extra); },
      config_.storage_retry_attempts);
}

Result StatsAggregator::record_counters(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                        const CounterMap& counters) {
  if (counters.empty()) {
    return Result::success();
  }
  GameStat stat = load_or_new(txn, player, source);
  merge_counters(stat.counters, counters);
  stat.updated_at = clock_.now();
  txn.put_stat(stat);
  return Result::success();
}

Result StatsAggregator::record_counters(const PlayerRef& player, GameSource source, const CounterMap& counters) {
  return store_.run([&](Store::Transaction& txn) { return record_counters(txn, player, source, counters); },
                    config_.storage_retry_attempts);
}

std::optional<GameStat> StatsAggregator::stats(const PlayerRef& player, GameSource source) const {
  return store_.stat(player.user_id, player.community_id, source);
}

std::vector<GameStat> StatsAggregator::all_stats(const PlayerRef& player) const {
  std::vector<GameStat> rows = store_.stats_for(player.user_id, player.community_id);
  std::ranges::stable_sort(rows, [](const GameStat& lhs, const GameStat& rhs) { return lhs.played > rhs.played; });
  return rows;
}

WrappedStats StatsAggregator::wrapped(const PlayerRef& player) const {
  WrappedStats wrapped;

  for (const GameStat& stat : all_stats(player)) {
    wrapped.total_games += stat.played;
    wrapped.total_won += stat.wins;
    wrapped.total_lost += stat.losses;
    wrapped.best_streak = std::max(wrapped.best_streak, stat.best_win_streak);
    wrapped.worst_streak = std::max(wrapped.worst_streak, stat.worst_losing_streak);
    if (stat.played > 0 && stat.played > wrapped.favorite_game_played) {
      wrapped.favorite_game = stat.source;
      wrapped.favorite_game_played = stat.played;
    }
  }

  std::int64_t max_delta = 0;
  std::int64_t min_delta = 0;
  for (const LedgerEntry& entry : store_.ledger_for(player.user_id, player.community_id)) {
    if (is_non_game_source(entry.source)) {
      continue;
    }
    if (entry.delta < 0) {
      wrapped.total_wagered += -entry.delta;
    } else {
      wrapped.total_winnings += entry.delta;
    }
    max_delta = std::max(max_delta, entry.delta);
    min_delta = std::min(min_delta, entry.delta);
  }

  wrapped.net_profit = wrapped.total_winnings - wrapped.total_wagered;
  wrapped.win_rate = wrapped.total_games > 0
                         ? (static_cast<double>(wrapped.total_won) / static_cast<double>(wrapped.total_games)) * 100.0
                         : 0.0;
  wrapped.biggest_win = max_delta;
  wrapped.biggest_loss = std::llabs(min_delta);
  return wrapped;
}

}  // namespace hogpen

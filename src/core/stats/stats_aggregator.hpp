#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"
#include "core/util/clock.hpp"

namespace hogpen {

// Folds one finished game into a stat row. Counters merge additively.
void apply_game_result(GameStat& stat, bool won, std::int64_t bet, std::int64_t payout, const CounterMap& counters);

class StatsAggregator {
public:
  StatsAggregator(Store& store, const CasinoConfig& config, const util::Clock& clock);

  Result record(const PlayerRef& player, GameSource source, bool won, std::int64_t bet, std::int64_t payout,
                const CounterMap& extra = {});
  Result record(Store::Transaction& txn, const PlayerRef& player, GameSource source, bool won, std::int64_t bet,
                std::int64_t payout, const CounterMap& extra = {});

  // Merges counters without counting a game.
  Result record_counters(const PlayerRef& player, GameSource source, const CounterMap& counters);
  Result record_counters(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                         const CounterMap& counters);

  [[nodiscard]] std::optional<GameStat> stats(const PlayerRef& player, GameSource source) const;
  // Most played first.
  [[nodiscard]] std::vector<GameStat> all_stats(const PlayerRef& player) const;
  [[nodiscard]] WrappedStats wrapped(const PlayerRef& player) const;

private:
  Store& store_;
  const CasinoConfig& config_;
  const util::Clock& clock_;

  [[nodiscard]] GameStat load_or_new(Store::Transaction& txn, const PlayerRef& player, GameSource source) const;
};

}  // namespace hogpen

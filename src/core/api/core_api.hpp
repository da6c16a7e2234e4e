#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/wallet_ledger.hpp"
#include "core/model/types.hpp"
#include "core/rank/rank_projector.hpp"
#include "core/rng/random_source.hpp"
#include "core/service/casino_service.hpp"
#include "core/session/session_coordinator.hpp"
#include "core/stats/stats_aggregator.hpp"
#include "core/storage/store.hpp"
#include "core/util/clock.hpp"

namespace hogpen {

struct InitConfig {
  std::string data_dir;
  // Optional key=value file; a missing file keeps the defaults.
  std::string config_path;
  // Takes precedence over config_path when set.
  std::optional<CasinoConfig> casino;
  // Defaults to the system clock and libsodium's generator.
  const util::Clock* clock = nullptr;
  RandomSource* rng = nullptr;
  // Crash and refund stale games while opening.
  bool recover_on_start = true;
};

struct CasinoStatusReport {
  std::string data_dir;
  std::string journal_path;
  std::string version;
  StoreHealthReport store;
  std::size_t recovered_on_start = 0;
};

class CoreApi {
public:
  CoreApi();
  ~CoreApi();

  CoreApi(const CoreApi&) = delete;
  CoreApi& operator=(const CoreApi&) = delete;

  Result init(const InitConfig& config);
  [[nodiscard]] bool ready() const { return ready_; }
  [[nodiscard]] const CasinoConfig& config() const { return config_; }

  // Wallet
  Result adjust_balance(const BalanceChange& change, std::int64_t& new_balance);
  Result transfer(std::string_view from_user, std::string_view to_user, std::string_view community_id,
                  std::int64_t amount, std::int64_t& from_balance, std::int64_t& to_balance);
  Result balance(const PlayerRef& player, std::int64_t& out);
  std::vector<LedgerEntry> balance_history(const PlayerRef& player, std::size_t limit = 0) const;
  std::vector<LedgerEntry> recent_transactions(const PlayerRef& player, std::size_t limit = 10) const;
  Result audit_account(const PlayerRef& player) const;
  Result verify_ledger() const;

  // Sessions
  Result start_game(const PlayerRef& player, GameSource source, std::int64_t bet_amount, std::string snapshot,
                    GameSession& out);
  Result finish_game(const PlayerRef& player, GameSource source);
  bool has_active_game(const PlayerRef& player, GameSource source) const;
  Result check_and_recover(const PlayerRef& player, GameSource source, RecoveryReport& out);
  Result recover_all(std::size_t& recovered);
  Result prune_old_games(std::int64_t days, std::size_t& pruned);
  std::vector<CrashRecord> crash_history(const PlayerRef& player) const;

  // Stats
  Result record_stats(const PlayerRef& player, GameSource source, bool won, std::int64_t bet, std::int64_t payout,
                      const CounterMap& extra = {});
  std::optional<GameStat> stats(const PlayerRef& player, GameSource source) const;
  std::vector<GameStat> all_stats(const PlayerRef& player) const;
  WrappedStats wrapped_stats(const PlayerRef& player) const;

  // Games
  Result start_card_duel(const PlayerRef& player, std::int64_t bet, GameReport& out);
  Result card_duel_action(const PlayerRef& player, CardDuelAction action, GameReport& out);
  Result start_reel(const PlayerRef& player, std::int64_t bet, GameReport& out);
  Result crank_reel(const PlayerRef& player, GameReport& out);
  Result start_wheel(const PlayerRef& player, std::int64_t base_bet, GameReport& out);
  Result place_wheel_bet(const PlayerRef& player, WheelBetType type, int pocket, GameReport& out);
  Result clear_wheel_bets(const PlayerRef& player, GameReport& out);
  Result cancel_wheel(const PlayerRef& player, GameReport& out);
  Result spin_wheel(const PlayerRef& player, GameReport& out);
  Result start_ladder(const PlayerRef& player, std::int64_t bet, GameReport& out);
  Result ladder_guess(const PlayerRef& player, LadderChoice choice, GameReport& out);
  Result ladder_cash_out(const PlayerRef& player, GameReport& out);
  Result expire_game(const PlayerRef& player, GameSource source, GameReport& out);
  std::int64_t jackpot_amount(std::string_view community_id) const;

  // Economy
  Result beg(const PlayerRef& player, std::int64_t& amount, std::int64_t& new_balance);
  Result loan(std::string_view lender_id, std::string_view receiver_id, std::string_view community_id,
              std::int64_t amount, std::int64_t& lender_balance, std::int64_t& receiver_balance);

  // Ranks
  std::vector<LeaderboardEntry> leaderboard(std::string_view community_id, std::size_t limit = 10) const;
  std::optional<LeaderboardEntry> rank_of(const PlayerRef& player) const;
  std::optional<LeaderboardEntry> richest(std::string_view community_id) const;
  void set_role_sink(RoleSink* sink);
  void wait_for_rank_updates();

  CasinoStatusReport status() const;
  Result compact_journal();

  // Test hooks.
  Store& store() { return store_; }

private:
  CasinoConfig config_;
  std::string data_dir_;
  std::size_t recovered_on_start_ = 0;
  bool ready_ = false;
  RoleSink* role_sink_ = nullptr;

  util::SystemClock system_clock_;
  SodiumRandomSource sodium_rng_;
  const util::Clock* clock_ = &system_clock_;
  RandomSource* rng_ = &sodium_rng_;

  Store store_;
  std::unique_ptr<WalletLedger> ledger_;
  std::unique_ptr<SessionCoordinator> sessions_;
  std::unique_ptr<StatsAggregator> stats_;
  std::unique_ptr<RankProjector> ranks_;
  std::unique_ptr<CasinoService> casino_;

  Result not_ready() const;
};

}  // namespace hogpen

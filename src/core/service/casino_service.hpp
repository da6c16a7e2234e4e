#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/games/card_duel.hpp"
#include "core/games/ladder.hpp"
#include "core/games/outcome.hpp"
#include "core/games/reel.hpp"
#include "core/games/wheel.hpp"
#include "core/ledger/wallet_ledger.hpp"
#include "core/model/types.hpp"
#include "core/rng/random_source.hpp"
#include "core/session/session_coordinator.hpp"
#include "core/stats/stats_aggregator.hpp"
#include "core/storage/store.hpp"
#include "core/util/clock.hpp"

namespace hogpen {

// What a player action did. `snapshot` decodes with the matching engine's decode_state.
struct GameReport {
  GameSource source = GameSource::CardDuel;
  std::uint64_t session_id = 0;
  bool finished = false;
  // Stake still riding on the game.
  std::int64_t outstanding = 0;
  // Credited by this action, stakes included.
  std::int64_t payout = 0;
  std::int64_t balance = 0;
  std::vector<GameOutcome> outcomes;
  std::string snapshot;
  std::string note;
  // A stale game of the same kind was crashed and refunded first.
  bool recovered_stale = false;
  // Reel only.
  std::optional<ReelLine> reel_line;
  std::int64_t jackpot_amount = 0;
  // Wheel only.
  std::optional<int> pocket;
};

class CasinoService {
public:
  CasinoService(Store& store, WalletLedger& ledger, SessionCoordinator& sessions, StatsAggregator& stats,
                const CasinoConfig& config, const util::Clock& clock, RandomSource& rng);

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

  // Inactivity timeout raised by the front-end. Placed wheel bets are refunded; in every
  // other game the outstanding wager is lost.
  Result expire_game(const PlayerRef& player, GameSource source, GameReport& out);

  Result beg(const PlayerRef& player, std::int64_t& amount, std::int64_t& new_balance);
  Result loan(std::string_view lender_id, std::string_view receiver_id, std::string_view community_id,
              std::int64_t amount, std::int64_t& lender_balance, std::int64_t& receiver_balance);

  [[nodiscard]] std::int64_t jackpot_amount(std::string_view community_id) const;

  [[nodiscard]] const CardDuelEngine& card_duel() const { return card_duel_; }
  [[nodiscard]] const ReelEngine& reel() const { return reel_; }
  [[nodiscard]] const WheelEngine& wheel() const { return wheel_; }
  [[nodiscard]] const LadderEngine& ladder() const { return ladder_; }

private:
  using Step = std::function<Result(Store::Transaction&)>;

  Store& store_;
  WalletLedger& ledger_;
  SessionCoordinator& sessions_;
  StatsAggregator& stats_;
  const CasinoConfig& config_;
  const util::Clock& clock_;
  RandomSource& rng_;

  CardDuelEngine card_duel_;
  ReelEngine reel_;
  WheelEngine wheel_;
  LadderEngine ladder_;

  Result validate_bet(GameSource source, std::int64_t bet) const;

  // Runs one action as a unit of work. An exception from the step, or a CrashDetected
  // result, crashes the session so the outstanding wager is refunded.
  Result guarded(const PlayerRef& player, GameSource source, const Step& step);

  // Stale-game recovery, the opening debit and the session row, in the caller's unit of work.
  Result open_game(Store::Transaction& txn, const PlayerRef& player, GameSource source, std::int64_t debit,
                   std::string snapshot, GameReport& report);
  Result load_game(Store::Transaction& txn, const PlayerRef& player, GameSource source, GameSession& session,
                   GameReport& report);
  Result place_wager(Store::Transaction& txn, const PlayerRef& player, GameSource source, std::int64_t amount,
                     Metadata metadata);
  // Ledger side of one outcome: a credit for a payout, a zero-delta entry otherwise.
  Result credit_outcome(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                        const GameOutcome& outcome, Metadata metadata, GameReport& report);
  // Ledger plus stats for a self-contained outcome.
  Result settle(Store::Transaction& txn, const PlayerRef& player, GameSource source, const GameOutcome& outcome,
                GameReport& report);
  Result close_game(Store::Transaction& txn, const PlayerRef& player, GameSource source, GameReport& report);
  Result keep_game(Store::Transaction& txn, const PlayerRef& player, GameSource source, std::int64_t outstanding,
                   std::string snapshot, GameReport& report);
  void fill_balance(Store::Transaction& txn, const PlayerRef& player, GameReport& report) const;
};

}  // namespace hogpen

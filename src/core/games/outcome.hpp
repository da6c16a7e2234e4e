#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace hogpen {

enum class OutcomeKind {
  Win,
  Loss,
  Push,
  Blackjack,
  Jackpot,
  CashOut,
};

struct OutcomeFlags {
  bool bonus_spin = false;
  bool jackpot_hit = false;
  bool doubled = false;
  bool natural = false;
};

// One resolved wager. Every engine reports results in this shape so the ledger and the
// stats aggregator consume them identically.
struct GameOutcome {
  OutcomeKind kind = OutcomeKind::Loss;
  std::int64_t wager = 0;
  // Total credited to the player, stake included. Zero on a loss.
  std::int64_t payout = 0;
  double multiplier = 0.0;
  OutcomeFlags flags;
  CounterMap counters;
  std::string label;

  [[nodiscard]] bool won() const {
    return kind == OutcomeKind::Win || kind == OutcomeKind::Blackjack || kind == OutcomeKind::Jackpot ||
           kind == OutcomeKind::CashOut;
  }

  // Pushes return the stake and are not counted as games.
  [[nodiscard]] bool counts_as_game() const { return kind != OutcomeKind::Push; }

  [[nodiscard]] UpdateKind ledger_kind() const {
    if (kind == OutcomeKind::Push) {
      return UpdateKind::BetPush;
    }
    return won() ? UpdateKind::BetWon : UpdateKind::BetLost;
  }
};

inline std::string_view outcome_kind_name(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::Win:
      return "win";
    case OutcomeKind::Loss:
      return "loss";
    case OutcomeKind::Push:
      return "push";
    case OutcomeKind::Blackjack:
      return "blackjack";
    case OutcomeKind::Jackpot:
      return "jackpot";
    case OutcomeKind::CashOut:
      return "cash_out";
  }
  return "loss";
}

}  // namespace hogpen

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/games/outcome.hpp"
#include "core/model/types.hpp"
#include "core/rng/deck.hpp"

namespace hogpen {

enum class LadderChoice {
  Red,
  Black,
  Higher,
  Lower,
  Inside,
  Outside,
  Spades,
  Hearts,
  Diamonds,
  Clubs,
};

inline constexpr int kLadderRounds = 4;

struct LadderState {
  std::int64_t bet = 0;
  int stage = 1;       // round about to be played
  int multiplier = 0;  // earned so far
  std::vector<Card> cards;
  Deck deck;
  bool finished = false;
};

struct LadderStep {
  // Intermediate correct guess; the game goes on.
  bool round_won = false;
  bool finished = false;
  std::optional<GameOutcome> outcome;
  // Round counters; merged without a game on an intermediate win.
  CounterMap counters;
  std::string actual;
  std::string note;
};

// Ride the bus: color, higher/lower, inside/outside, suit.
class LadderEngine {
public:
  Result deal(std::int64_t bet, Deck deck, RandomSource& rng, LadderState& state) const;
  Result guess(LadderState& state, LadderChoice choice, RandomSource& rng, LadderStep& step) const;
  // Allowed once round 1 is won.
  Result cash_out(LadderState& state, LadderStep& step) const;

  [[nodiscard]] bool choice_fits_stage(int stage, LadderChoice choice) const;
  static int round_multiplier(int stage);

  static std::string encode_state(const LadderState& state);
  static bool decode_state(std::string_view snapshot, LadderState& out);
};

std::string_view ladder_choice_name(LadderChoice choice);
std::optional<LadderChoice> ladder_choice_from_name(std::string_view name);

}  // namespace hogpen

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/games/outcome.hpp"
#include "core/model/types.hpp"
#include "core/rng/deck.hpp"

namespace hogpen {

enum class CardDuelAction {
  Hit,
  Stand,
  Double,
  Split,
};

struct DuelHand {
  std::vector<Card> cards;
  std::int64_t bet = 0;
  bool doubled = false;
  bool from_split = false;
  bool finished = false;

  [[nodiscard]] int total() const { return hand_total(cards); }
  [[nodiscard]] bool busted() const { return total() > 21; }
};

struct CardDuelState {
  std::int64_t base_bet = 0;
  std::vector<DuelHand> hands;
  std::size_t active_hand = 0;
  std::vector<Card> dealer;
  Deck deck;
  bool finished = false;

  [[nodiscard]] const Card& dealer_upcard() const { return dealer.front(); }
  [[nodiscard]] std::int64_t total_wagered() const;
};

struct CardDuelStep {
  // Extra stake the action requires before it takes effect (double, split).
  std::int64_t extra_wager = 0;
  bool finished = false;
  // One per hand once the game resolves.
  std::vector<GameOutcome> outcomes;
  std::string note;
};

// Blackjack against a dealer who stands on `dealer_stand_value`.
class CardDuelEngine {
public:
  explicit CardDuelEngine(int dealer_stand_value = 17) : dealer_stand_value_(dealer_stand_value) {}

  // Deals player, player, dealer, dealer. An empty deck is replaced by a shuffled one.
  // Resolves immediately on a dealer peek blackjack or a player natural.
  Result deal(std::int64_t bet, Deck deck, RandomSource& rng, CardDuelState& state, CardDuelStep& step) const;

  Result act(CardDuelState& state, CardDuelAction action, RandomSource& rng, CardDuelStep& step) const;

  [[nodiscard]] bool can_double(const CardDuelState& state) const;
  [[nodiscard]] bool can_split(const CardDuelState& state) const;
  [[nodiscard]] int dealer_stand_value() const { return dealer_stand_value_; }

  static std::string encode_state(const CardDuelState& state);
  static bool decode_state(std::string_view snapshot, CardDuelState& out);

private:
  int dealer_stand_value_;

  void advance_or_resolve(CardDuelState& state, RandomSource& rng, CardDuelStep& step) const;
  void resolve(CardDuelState& state, RandomSource& rng, CardDuelStep& step) const;
};

std::string_view card_duel_action_name(CardDuelAction action);
bool card_duel_action_from_name(std::string_view name, CardDuelAction& out);

}  // namespace hogpen

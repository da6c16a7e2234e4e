#include "core/games/card_duel.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include "core/util/canonical.hpp"

namespace hogpen {
namespace {

constexpr const char* kStatBlackjackWins = "blackjack_wins";
constexpr const char* kStatDoubleDownWins = "double_down_wins";
constexpr const char* kStatDoubleDownLosses = "double_down_losses";

bool peek_required(const Card& upcard) {
  return upcard.rank == kRankAce || is_ten_value(upcard);
}

std::string hand_prefix(std::size_t index) {
  return "hand." + std::to_string(index) + ".";
}

}  // namespace

std::int64_t CardDuelState::total_wagered() const {
  return std::accumulate(hands.begin(), hands.end(), std::int64_t{0},
                         [](std::int64_t sum, const DuelHand& hand) { return sum + hand.bet; });
}

Result CardDuelEngine::deal(std::int64_t bet, Deck deck, RandomSource& rng, CardDuelState& state,
                            CardDuelStep& step) const {
  if (bet <= 0) {
    return Result::failure("Bet must be positive.", ErrorCode::ValidationError);
  }

  state = CardDuelState{};
  step = CardDuelStep{};
  state.base_bet = bet;
  state.deck = deck.empty() ? shuffled_deck(rng) : std::move(deck);

  const Card p1 = draw_card(state.deck, rng);
  const Card p2 = draw_card(state.deck, rng);
  const Card d1 = draw_card(state.deck, rng);
  const Card d2 = draw_card(state.deck, rng);
  state.hands.push_back(DuelHand{.cards = {p1, p2}, .bet = bet});
  state.dealer = {d1, d2};

  const bool player_natural = state.hands.front().total() == 21;
  const bool dealer_blackjack = hand_total(state.dealer) == 21;

  if (peek_required(state.dealer_upcard()) && dealer_blackjack) {
    state.finished = true;
    state.hands.front().finished = true;
    step.finished = true;

    GameOutcome outcome;
    outcome.wager = bet;
    if (player_natural) {
      outcome.kind = OutcomeKind::Push;
      outcome.payout = bet;
      outcome.multiplier = 1.0;
      outcome.flags.natural = true;
      outcome.label = "push: both blackjack";
      step.note = "Dealer and player both have blackjack. Push.";
    } else {
      outcome.kind = OutcomeKind::Loss;
      outcome.label = "dealer blackjack";
      step.note = "Dealer has blackjack.";
    }
    step.outcomes.push_back(std::move(outcome));
    return Result::success(step.note);
  }

  if (player_natural) {
    state.finished = true;
    state.hands.front().finished = true;
    step.finished = true;

    GameOutcome outcome;
    outcome.kind = OutcomeKind::Blackjack;
    outcome.wager = bet;
    outcome.payout = (bet * 5) / 2;
    outcome.multiplier = 2.5;
    outcome.flags.natural = true;
    outcome.counters[kStatBlackjackWins] = 1;
    outcome.label = "natural blackjack";
    step.note = "Blackjack!";
    step.outcomes.push_back(std::move(outcome));
    return Result::success(step.note);
  }

  step.note = "Cards dealt.";
  return Result::success(step.note);
}

bool CardDuelEngine::can_double(const CardDuelState& state) const {
  if (state.finished || state.active_hand >= state.hands.size()) {
    return false;
  }
  const DuelHand& hand = state.hands[state.active_hand];
  return !hand.finished && !hand.doubled && hand.cards.size() == 2;
}

bool CardDuelEngine::can_split(const CardDuelState& state) const {
  if (state.finished || state.hands.size() != 1) {
    return false;
  }
  const DuelHand& hand = state.hands.front();
  return !hand.finished && !hand.from_split && hand.cards.size() == 2 &&
         blackjack_value(hand.cards[0]) == blackjack_value(hand.cards[1]);
}

Result CardDuelEngine::act(CardDuelState& state, CardDuelAction action, RandomSource& rng,
                           CardDuelStep& step) const {
  step = CardDuelStep{};
  if (state.finished) {
    return Result::failure("This hand is already over.", ErrorCode::ValidationError);
  }
  if (state.active_hand >= state.hands.size() || state.hands[state.active_hand].finished) {
    return Result::failure("No playable hand.", ErrorCode::ValidationError);
  }

  DuelHand& hand = state.hands[state.active_hand];
  switch (action) {
    case CardDuelAction::Hit:
      hand.cards.push_back(draw_card(state.deck, rng));
      if (hand.busted()) {
        hand.finished = true;
        step.note = "Busted.";
      } else {
        step.note = "Hit.";
      }
      break;

    case CardDuelAction::Stand:
      hand.finished = true;
      step.note = "Stand.";
      break;

    case CardDuelAction::Double:
      if (!can_double(state)) {
        return Result::failure("Double is only allowed on an unplayed two-card hand.", ErrorCode::ValidationError);
      }
      step.extra_wager = hand.bet;
      hand.bet *= 2;
      hand.doubled = true;
      hand.cards.push_back(draw_card(state.deck, rng));
      hand.finished = true;
      step.note = hand.busted() ? "Double down... and busted." : "Double down.";
      break;

    case CardDuelAction::Split: {
      if (!can_split(state)) {
        return Result::failure("Split needs one unsplit pair of equal value.", ErrorCode::ValidationError);
      }
      step.extra_wager = state.base_bet;
      const Card first = hand.cards[0];
      const Card second = hand.cards[1];
      DuelHand left{.cards = {first, draw_card(state.deck, rng)}, .bet = state.base_bet, .from_split = true};
      DuelHand right{.cards = {second, draw_card(state.deck, rng)}, .bet = state.base_bet, .from_split = true};
      state.hands = {std::move(left), std::move(right)};
      state.active_hand = 0;
      step.note = "Split! Playing hand 1 first.";
      return Result::success(step.note);
    }
  }

  advance_or_resolve(state, rng, step);
  return Result::success(step.note);
}

void CardDuelEngine::advance_or_resolve(CardDuelState& state, RandomSource& rng, CardDuelStep& step) const {
  for (std::size_t idx = 0; idx < state.hands.size(); ++idx) {
    if (!state.hands[idx].finished) {
      state.active_hand = idx;
      return;
    }
  }
  resolve(state, rng, step);
}

void CardDuelEngine::resolve(CardDuelState& state, RandomSource& rng, CardDuelStep& step) const {
  state.finished = true;
  step.finished = true;

  const bool all_busted =
      std::ranges::all_of(state.hands, [](const DuelHand& hand) { return hand.busted(); });
  if (!all_busted) {
    while (hand_total(state.dealer) < dealer_stand_value_) {
      state.dealer.push_back(draw_card(state.deck, rng));
    }
  }

  const int dealer_total = hand_total(state.dealer);
  const bool dealer_bust = dealer_total > 21;

  for (std::size_t idx = 0; idx < state.hands.size(); ++idx) {
    const DuelHand& hand = state.hands[idx];
    GameOutcome outcome;
    outcome.wager = hand.bet;
    outcome.flags.doubled = hand.doubled;
    outcome.label = "hand " + std::to_string(idx + 1U);

    const int total = hand.total();
    if (total > 21) {
      outcome.kind = OutcomeKind::Loss;
    } else if (dealer_bust || total > dealer_total) {
      outcome.kind = OutcomeKind::Win;
      outcome.payout = hand.bet * 2;
      outcome.multiplier = 2.0;
    } else if (total < dealer_total) {
      outcome.kind = OutcomeKind::Loss;
    } else {
      outcome.kind = OutcomeKind::Push;
      outcome.payout = hand.bet;
      outcome.multiplier = 1.0;
    }

    if (hand.doubled && outcome.kind == OutcomeKind::Win) {
      outcome.counters[kStatDoubleDownWins] = 1;
    } else if (hand.doubled && outcome.kind == OutcomeKind::Loss) {
      outcome.counters[kStatDoubleDownLosses] = 1;
    }
    step.outcomes.push_back(std::move(outcome));
  }

  step.note = all_busted ? "All hands busted." : "Dealer stands on " + std::to_string(dealer_total) + ".";
  if (dealer_bust) {
    step.note = "Dealer busts with " + std::to_string(dealer_total) + ".";
  }
}

std::string CardDuelEngine::encode_state(const CardDuelState& state) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"base_bet", std::to_string(state.base_bet)},
      {"active_hand", std::to_string(state.active_hand)},
      {"finished", state.finished ? "1" : "0"},
      {"dealer", encode_cards(state.dealer)},
      {"deck", encode_cards(state.deck)},
      {"hands", std::to_string(state.hands.size())},
  };
  for (std::size_t idx = 0; idx < state.hands.size(); ++idx) {
    const DuelHand& hand = state.hands[idx];
    const std::string prefix = hand_prefix(idx);
    fields.emplace_back(prefix + "cards", encode_cards(hand.cards));
    fields.emplace_back(prefix + "bet", std::to_string(hand.bet));
    fields.emplace_back(prefix + "doubled", hand.doubled ? "1" : "0");
    fields.emplace_back(prefix + "from_split", hand.from_split ? "1" : "0");
    fields.emplace_back(prefix + "finished", hand.finished ? "1" : "0");
  }
  return util::canonical_join(std::move(fields));
}

bool CardDuelEngine::decode_state(std::string_view snapshot, CardDuelState& out) {
  const auto fields = util::parse_canonical_map(snapshot);
  CardDuelState state;
  state.base_bet = util::int_field_or(fields, "base_bet", -1);
  const std::int64_t active = util::int_field_or(fields, "active_hand", -1);
  const std::int64_t hand_count = util::int_field_or(fields, "hands", -1);
  if (state.base_bet <= 0 || active < 0 || hand_count <= 0 || hand_count > 2) {
    return false;
  }
  state.active_hand = static_cast<std::size_t>(active);
  state.finished = util::field_or(fields, "finished") == "1";
  if (!decode_cards(util::field_or(fields, "dealer"), state.dealer) || state.dealer.size() < 2 ||
      !decode_cards(util::field_or(fields, "deck"), state.deck)) {
    return false;
  }

  for (std::int64_t idx = 0; idx < hand_count; ++idx) {
    const std::string prefix = hand_prefix(static_cast<std::size_t>(idx));
    DuelHand hand;
    if (!decode_cards(util::field_or(fields, prefix + "cards"), hand.cards) || hand.cards.size() < 2) {
      return false;
    }
    hand.bet = util::int_field_or(fields, prefix + "bet", -1);
    if (hand.bet <= 0) {
      return false;
    }
    hand.doubled = util::field_or(fields, prefix + "doubled") == "1";
    hand.from_split = util::field_or(fields, prefix + "from_split") == "1";
    hand.finished = util::field_or(fields, prefix + "finished") == "1";
    state.hands.push_back(std::move(hand));
  }

  if (state.active_hand >= state.hands.size()) {
    return false;
  }
  out = std::move(state);
  return true;
}

std::string_view card_duel_action_name(CardDuelAction action) {
  switch (action) {
    case CardDuelAction::Hit:
      return "hit";
    case CardDuelAction::Stand:
      return "stand";
    case CardDuelAction::Double:
      return "double";
    case CardDuelAction::Split:
      return "split";
  }
  return "stand";
}

bool card_duel_action_from_name(std::string_view name, CardDuelAction& out) {
  for (const CardDuelAction action :
       {CardDuelAction::Hit, CardDuelAction::Stand, CardDuelAction::Double, CardDuelAction::Split}) {
    if (card_duel_action_name(action) == name) {
      out = action;
      return true;
    }
  }
  return false;
}

}  // namespace hogpen

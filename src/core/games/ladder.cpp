#include "core/games/ladder.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "core/util/canonical.hpp"

namespace hogpen {
namespace {

constexpr std::array<int, kLadderRounds> kRoundMultipliers = {2, 3, 4, 8};

std::string round_stat(int stage, bool won) {
  return "round_" + std::to_string(stage) + (won ? "_wins" : "_losses");
}

std::optional<Suit> choice_suit(LadderChoice choice) {
  switch (choice) {
    case LadderChoice::Spades:
      return Suit::Spades;
    case LadderChoice::Hearts:
      return Suit::Hearts;
    case LadderChoice::Diamonds:
      return Suit::Diamonds;
    case LadderChoice::Clubs:
      return Suit::Clubs;
    default:
      return std::nullopt;
  }
}

GameOutcome loss_outcome(const LadderState& state, CounterMap counters) {
  GameOutcome outcome;
  outcome.kind = OutcomeKind::Loss;
  outcome.wager = state.bet;
  outcome.counters = std::move(counters);
  outcome.label = "round " + std::to_string(state.stage);
  return outcome;
}

}  // namespace

int LadderEngine::round_multiplier(int stage) {
  if (stage < 1 || stage > kLadderRounds) {
    return 0;
  }
  return kRoundMultipliers[static_cast<std::size_t>(stage - 1)];
}

bool LadderEngine::choice_fits_stage(int stage, LadderChoice choice) const {
  switch (stage) {
    case 1:
      return choice == LadderChoice::Red || choice == LadderChoice::Black;
    case 2:
      return choice == LadderChoice::Higher || choice == LadderChoice::Lower;
    case 3:
      return choice == LadderChoice::Inside || choice == LadderChoice::Outside;
    case 4:
      return choice_suit(choice).has_value();
    default:
      return false;
  }
}

Result LadderEngine::deal(std::int64_t bet, Deck deck, RandomSource& rng, LadderState& state) const {
  if (bet <= 0) {
    return Result::failure("Bet must be positive.", ErrorCode::ValidationError);
  }
  state = LadderState{};
  state.bet = bet;
  state.deck = deck.empty() ? shuffled_deck(rng) : std::move(deck);
  return Result::success("Round 1: red or black?");
}

Result LadderEngine::guess(LadderState& state, LadderChoice choice, RandomSource& rng, LadderStep& step) const {
  step = LadderStep{};
  if (state.finished) {
    return Result::failure("This ride is already over.", ErrorCode::ValidationError);
  }
  if (!choice_fits_stage(state.stage, choice)) {
    return Result::failure("'" + std::string{ladder_choice_name(choice)} + "' is not a round " +
                               std::to_string(state.stage) + " choice.",
                           ErrorCode::ValidationError);
  }

  const Card card = draw_card(state.deck, rng);
  state.cards.push_back(card);

  bool won = false;
  switch (state.stage) {
    case 1: {
      const CardColor color = card_color(card);
      won = (choice == LadderChoice::Red) == (color == CardColor::Red);
      step.actual = color == CardColor::Red ? "red" : "black";
      step.counters[color == CardColor::Red ? "red_count" : "black_count"] = 1;
      break;
    }
    case 2: {
      const Card& first = state.cards[0];
      if (card.rank == first.rank) {
        step.actual = "tie";
        step.note = "It's a tie. House wins.";
        break;
      }
      const bool higher = card.rank > first.rank;
      won = (choice == LadderChoice::Higher) == higher;
      step.actual = higher ? "higher" : "lower";
      break;
    }
    case 3: {
      const Card& first = state.cards[0];
      const Card& second = state.cards[1];
      if (card.rank == first.rank || card.rank == second.rank) {
        step.actual = format_card(card);
        step.note = "The third card matches one of the first two.";
        break;
      }
      const int low = std::min(first.rank, second.rank);
      const int high = std::max(first.rank, second.rank);
      const bool inside = low < card.rank && card.rank < high;
      won = (choice == LadderChoice::Inside) == inside;
      step.actual = inside ? "inside" : "outside";
      break;
    }
    default:
      won = choice_suit(choice) == card.suit;
      step.actual = std::string{suit_symbol(card.suit)};
      break;
  }

  step.counters[round_stat(state.stage, won)] = 1;

  if (!won) {
    state.finished = true;
    step.finished = true;
    if (step.note.empty()) {
      step.note = "Wrong guess: it was " + step.actual + ".";
    }
    step.outcome = loss_outcome(state, step.counters);
    return Result::success(step.note);
  }

  state.multiplier = round_multiplier(state.stage);
  if (state.stage == kLadderRounds) {
    state.finished = true;
    step.finished = true;
    step.counters["wins_8x"] = 1;

    GameOutcome outcome;
    outcome.kind = OutcomeKind::Win;
    outcome.wager = state.bet;
    outcome.multiplier = state.multiplier;
    outcome.payout = state.bet * state.multiplier;
    outcome.counters = step.counters;
    outcome.label = "round " + std::to_string(state.stage);
    step.outcome = std::move(outcome);
    step.note = "You rode the bus all the way!";
    return Result::success(step.note);
  }

  step.round_won = true;
  step.note = "Correct! Multiplier is now " + std::to_string(state.multiplier) + "x.";
  ++state.stage;
  return Result::success(step.note);
}

Result LadderEngine::cash_out(LadderState& state, LadderStep& step) const {
  step = LadderStep{};
  if (state.finished) {
    return Result::failure("This ride is already over.", ErrorCode::ValidationError);
  }
  if (state.stage <= 1 || state.multiplier <= 0) {
    return Result::failure("Win round 1 before cashing out.", ErrorCode::ValidationError);
  }

  state.finished = true;
  step.finished = true;

  GameOutcome outcome;
  outcome.kind = OutcomeKind::CashOut;
  outcome.wager = state.bet;
  outcome.multiplier = state.multiplier;
  outcome.payout = state.bet * state.multiplier;
  outcome.label = "cash out after round " + std::to_string(state.stage - 1);
  step.outcome = std::move(outcome);
  step.note = "Cashed out at " + std::to_string(state.multiplier) + "x.";
  return Result::success(step.note);
}

std::string LadderEngine::encode_state(const LadderState& state) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"bet", std::to_string(state.bet)},
      {"stage", std::to_string(state.stage)},
      {"multiplier", std::to_string(state.multiplier)},
      {"cards", encode_cards(state.cards)},
      {"deck", encode_cards(state.deck)},
      {"finished", state.finished ? "1" : "0"},
  });
}

bool LadderEngine::decode_state(std::string_view snapshot, LadderState& out) {
  const auto fields = util::parse_canonical_map(snapshot);
  LadderState state;
  state.bet = util::int_field_or(fields, "bet", -1);
  state.stage = static_cast<int>(util::int_field_or(fields, "stage", -1));
  state.multiplier = static_cast<int>(util::int_field_or(fields, "multiplier", -1));
  state.finished = util::field_or(fields, "finished") == "1";
  if (state.bet <= 0 || state.stage < 1 || state.stage > kLadderRounds || state.multiplier < 0) {
    return false;
  }
  if (!decode_cards(util::field_or(fields, "cards"), state.cards) ||
      !decode_cards(util::field_or(fields, "deck"), state.deck)) {
    return false;
  }
  if (!state.finished && state.cards.size() != static_cast<std::size_t>(state.stage - 1)) {
    return false;
  }
  out = std::move(state);
  return true;
}

std::string_view ladder_choice_name(LadderChoice choice) {
  switch (choice) {
    case LadderChoice::Red:
      return "red";
    case LadderChoice::Black:
      return "black";
    case LadderChoice::Higher:
      return "higher";
    case LadderChoice::Lower:
      return "lower";
    case LadderChoice::Inside:
      return "inside";
    case LadderChoice::Outside:
      return "outside";
    case LadderChoice::Spades:
      return "spades";
    case LadderChoice::Hearts:
      return "hearts";
    case LadderChoice::Diamonds:
      return "diamonds";
    case LadderChoice::Clubs:
      return "clubs";
  }
  return "red";
}

std::optional<LadderChoice> ladder_choice_from_name(std::string_view name) {
  for (const LadderChoice choice :
       {LadderChoice::Red, LadderChoice::Black, LadderChoice::Higher, LadderChoice::Lower, LadderChoice::Inside,
        LadderChoice::Outside, LadderChoice::Spades, LadderChoice::Hearts, LadderChoice::Diamonds,
        LadderChoice::Clubs}) {
    if (ladder_choice_name(choice) == name) {
      return choice;
    }
  }
  return std::nullopt;
}

}  // namespace hogpen

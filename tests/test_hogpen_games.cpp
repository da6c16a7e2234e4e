#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "core/games/card_duel.hpp"
#include "core/games/ladder.hpp"
#include "core/games/reel.hpp"
#include "core/games/wheel.hpp"
#include "core/rng/deck.hpp"
#include "core/rng/random_source.hpp"

namespace {

hogpen::Card card(int rank, hogpen::Suit suit) {
  return hogpen::Card{.rank = rank, .suit = suit};
}

// Cards are drawn from the back, so the deck is written last-drawn first.
hogpen::Deck deck_drawing(std::vector<hogpen::Card> in_draw_order) {
  return hogpen::Deck(in_draw_order.rbegin(), in_draw_order.rend());
}

void test_deck_and_totals() {
  using hogpen::Suit;

  const hogpen::Deck deck = hogpen::fresh_deck();
  assert(deck.size() == hogpen::kDeckSize);
  std::set<std::string> labels;
  for (const hogpen::Card& c : deck) {
    labels.insert(hogpen::format_card(c));
  }
  assert(labels.size() == hogpen::kDeckSize);

  const std::vector<hogpen::Card> ace_king = {card(hogpen::kRankAce, Suit::Spades),
                                              card(hogpen::kRankKing, Suit::Hearts)};
  assert(hogpen::hand_total(ace_king) == 21);
  assert(hogpen::is_soft_total(ace_king));

  const std::vector<hogpen::Card> aces_nine = {card(hogpen::kRankAce, Suit::Spades),
                                               card(hogpen::kRankAce, Suit::Hearts), card(9, Suit::Clubs)};
  assert(hogpen::hand_total(aces_nine) == 21);

  const std::vector<hogpen::Card> stiff = {card(10, Suit::Spades), card(6, Suit::Hearts), card(9, Suit::Clubs)};
  assert(hogpen::hand_total(stiff) == 25);

  std::vector<hogpen::Card> decoded;
  assert(hogpen::decode_cards(hogpen::encode_cards(aces_nine), decoded));
  assert(decoded == aces_nine);
  assert(!hogpen::decode_cards("15X", decoded));

  // An all-zero shuffle rotates the fresh deck left by one.
  hogpen::ScriptedRandomSource zeros({});
  hogpen::Deck shuffled = hogpen::shuffled_deck(zeros);
  assert(hogpen::draw_card(shuffled, zeros) == card(2, Suit::Spades));
  assert(hogpen::draw_card(shuffled, zeros) == card(hogpen::kRankAce, Suit::Clubs));
  assert(hogpen::draw_card(shuffled, zeros) == card(hogpen::kRankKing, Suit::Clubs));
}

void test_random_helpers() {
  hogpen::ScriptedRandomSource scripted({17, 40, 3});
  assert(scripted.uniform(38) == 17);
  assert(scripted.uniform(38) == 2);
  assert(hogpen::uniform_between(500, 1000, scripted) == 503);
  assert(scripted.uniform(10) == 0);

  const std::vector<std::uint32_t> weights = {1, 2, 3};
  hogpen::ScriptedRandomSource rolls({0, 1, 2, 3, 5});
  assert(hogpen::weighted_index(weights, rolls) == 0);
  assert(hogpen::weighted_index(weights, rolls) == 1);
  assert(hogpen::weighted_index(weights, rolls) == 1);
  assert(hogpen::weighted_index(weights, rolls) == 2);
  assert(hogpen::weighted_index(weights, rolls) == 2);

  hogpen::SeededRandomSource seeded_a(42);
  hogpen::SeededRandomSource seeded_b(42);
  for (int i = 0; i < 20; ++i) {
    const std::uint32_t value = seeded_a.uniform(100);
    assert(value < 100);
    assert(value == seeded_b.uniform(100));
  }
}

void test_card_duel_natural_and_peek() {
  using hogpen::Suit;
  const hogpen::CardDuelEngine engine;
  hogpen::ScriptedRandomSource rng({});

  hogpen::CardDuelState state;
  hogpen::CardDuelStep step;
  hogpen::Result dealt = engine.deal(100,
                                     deck_drawing({card(hogpen::kRankAce, Suit::Spades), card(13, Suit::Hearts),
                                                   card(5, Suit::Clubs), card(9, Suit::Diamonds)}),
                                     rng, state, step);
  assert(dealt.ok);
  assert(step.finished);
  assert(step.outcomes.size() == 1);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Blackjack);
  assert(step.outcomes.front().payout == 250);
  assert(step.outcomes.front().counters.at("blackjack_wins") == 1);

  dealt = engine.deal(100,
                      deck_drawing({card(10, Suit::Spades), card(7, Suit::Hearts),
                                    card(hogpen::kRankAce, Suit::Clubs), card(13, Suit::Diamonds)}),
                      rng, state, step);
  assert(dealt.ok);
  assert(step.finished);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Loss);
  assert(step.outcomes.front().payout == 0);

  dealt = engine.deal(100,
                      deck_drawing({card(hogpen::kRankAce, Suit::Spades), card(12, Suit::Hearts),
                                    card(hogpen::kRankAce, Suit::Clubs), card(13, Suit::Diamonds)}),
                      rng, state, step);
  assert(dealt.ok);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Push);
  assert(step.outcomes.front().payout == 100);
  assert(!step.outcomes.front().counts_as_game());

  assert(!engine.deal(0, {}, rng, state, step).ok);
}

void test_card_duel_hit_stand_and_double() {
  using hogpen::Suit;
  const hogpen::CardDuelEngine engine;

  // Zero shuffle: player S2 + CA, dealer CK + CQ, then CJ, C10.
  hogpen::ScriptedRandomSource rng({});
  hogpen::CardDuelState state;
  hogpen::CardDuelStep step;
  assert(engine.deal(100, {}, rng, state, step).ok);
  assert(!step.finished);
  assert(state.hands.front().total() == 13);
  assert(hogpen::hand_total(state.dealer) == 20);

  hogpen::CardDuelState standing = state;
  assert(engine.act(standing, hogpen::CardDuelAction::Stand, rng, step).ok);
  assert(step.finished);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Loss);

  hogpen::CardDuelState hitting = state;
  assert(engine.act(hitting, hogpen::CardDuelAction::Hit, rng, step).ok);
  assert(!step.finished);
  assert(hitting.hands.front().total() == 13);
  assert(engine.act(hitting, hogpen::CardDuelAction::Hit, rng, step).ok);
  assert(step.finished);
  assert(hitting.hands.front().busted());
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Loss);
  assert(!engine.act(hitting, hogpen::CardDuelAction::Hit, rng, step).ok);

  hogpen::CardDuelState doubling = state;
  assert(engine.act(doubling, hogpen::CardDuelAction::Double, rng, step).ok);
  assert(step.extra_wager == 100);
  assert(step.finished);
  assert(doubling.hands.front().bet == 200);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Loss);
  assert(step.outcomes.front().counters.at("double_down_losses") == 1);

  hogpen::CardDuelState winning_double;
  assert(engine.deal(100,
                     deck_drawing({card(5, Suit::Spades), card(6, Suit::Hearts), card(10, Suit::Clubs),
                                   card(7, Suit::Diamonds), card(10, Suit::Hearts)}),
                     rng, winning_double, step)
             .ok);
  assert(engine.can_double(winning_double));
  assert(!engine.can_split(winning_double));
  assert(engine.act(winning_double, hogpen::CardDuelAction::Double, rng, step).ok);
  assert(step.outcomes.front().kind == hogpen::OutcomeKind::Win);
  assert(step.outcomes.front().payout == 400);
  assert(step.outcomes.front().flags.doubled);
  assert(step.outcomes.front().counters.at("double_down_wins") == 1);
}

void test_card_duel_split() {
  using hogpen::Suit;
  const hogpen::CardDuelEngine engine;
  hogpen::ScriptedRandomSource rng({});

  hogpen::CardDuelState state;
  hogpen::CardDuelStep step;
  assert(engine.deal(100,
                     deck_drawing({card(8, Suit::Spades), card(8, Suit::Hearts), card(10, Suit::Diamonds),
                                   card(7, Suit::Diamonds), card(10, Suit::Clubs), card(9, Suit::Clubs)}),
                     rng, state, step)
             .ok);
  assert(engine.can_split(state));
  assert(engine.act(state, hogpen::CardDuelAction::Split, rng, step).ok);
  assert(step.extra_wager == 100);
  assert(state.hands.size() == 2);
  assert(state.total_wagered() == 200);
  assert(state.hands[0].total() == 18);
  assert(state.hands[1].total() == 17);
  assert(!engine.can_split(state));

  assert(engine.act(state, hogpen::CardDuelAction::Stand, rng, step).ok);
  assert(!step.finished);
  assert(state.active_hand == 1);
  assert(engine.act(state, hogpen::CardDuelAction::Stand, rng, step).ok);
  assert(step.finished);
  assert(step.outcomes.size() == 2);
  assert(step.outcomes[0].kind == hogpen::OutcomeKind::Win);
  assert(step.outcomes[0].payout == 200);
  assert(step.outcomes[1].kind == hogpen::OutcomeKind::Push);
  assert(step.outcomes[1].payout == 100);
}

void test_card_duel_snapshot() {
  const hogpen::CardDuelEngine engine;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CardDuelState state;
  hogpen::CardDuelStep step;
  assert(engine.deal(250, {}, rng, state, step).ok);

  hogpen::CardDuelState restored;
  assert(hogpen::CardDuelEngine::decode_state(hogpen::CardDuelEngine::encode_state(state), restored));
  assert(restored.base_bet == 250);
  assert(restored.hands.size() == 1);
  assert(restored.hands.front().cards == state.hands.front().cards);
  assert(restored.dealer == state.dealer);
  assert(restored.deck == state.deck);
  assert(!hogpen::CardDuelEngine::decode_state("base_bet=0\n", restored));

  hogpen::CardDuelAction action = hogpen::CardDuelAction::Stand;
  assert(hogpen::card_duel_action_from_name("double", action));
  assert(action == hogpen::CardDuelAction::Double);
  assert(!hogpen::card_duel_action_from_name("surrender", action));
}

void test_reel_evaluation() {
  using hogpen::ReelSymbol;
  const hogpen::ReelEngine engine;

  const hogpen::ReelEvaluation hogs = engine.evaluate({ReelSymbol::Hog, ReelSymbol::Hog, ReelSymbol::Hog});
  assert(hogs.multiplier == 20);
  assert(hogs.jackpot_hit);

  const hogpen::GameOutcome jackpot =
      engine.settle({ReelSymbol::Hog, ReelSymbol::Hog, ReelSymbol::Hog}, 100, 5000000, false);
  assert(jackpot.kind == hogpen::OutcomeKind::Jackpot);
  assert(jackpot.payout == 2000 + 5000000);
  assert(jackpot.counters.at("jackpot_hits") == 1);

  const hogpen::ReelEvaluation trees = engine.evaluate({ReelSymbol::Tree, ReelSymbol::Tree, ReelSymbol::Tree});
  assert(trees.multiplier == 8);
  assert(trees.bonus_spin);
  assert(engine.evaluate({ReelSymbol::Snowflake, ReelSymbol::Snowflake, ReelSymbol::Snowflake}).multiplier == 6);
  assert(engine.evaluate({ReelSymbol::Santa, ReelSymbol::Santa, ReelSymbol::Santa}).multiplier == 10);
  assert(engine.evaluate({ReelSymbol::Hog, ReelSymbol::Bell, ReelSymbol::Hog}).multiplier == 5);
  assert(engine.evaluate({ReelSymbol::Gift, ReelSymbol::Gift, ReelSymbol::Bell}).multiplier == 2);
  assert(engine.evaluate({ReelSymbol::Gift, ReelSymbol::Santa, ReelSymbol::Bell}).multiplier == 0);

  const hogpen::GameOutcome miss = engine.settle({ReelSymbol::Gift, ReelSymbol::Santa, ReelSymbol::Bell}, 100, 0, false);
  assert(miss.kind == hogpen::OutcomeKind::Loss);
  assert(miss.payout == 0);

  // Weights 1, 2, 3, 3, 4, 6 over a total of 19.
  hogpen::ScriptedRandomSource rolls({0, 1, 18});
  const hogpen::ReelLine line = engine.spin(rolls);
  assert(line[0] == ReelSymbol::Hog);
  assert(line[1] == ReelSymbol::Tree);
  assert(line[2] == ReelSymbol::Gift);

  assert(hogpen::ReelEngine::jackpot_contribution(100, 100) == 100);
  assert(hogpen::ReelEngine::jackpot_contribution(1, 10) == 1);

  hogpen::ReelState restored;
  assert(hogpen::ReelEngine::decode_state(
      hogpen::ReelEngine::encode_state({.bet = 300, .spins_taken = 1, .bonus_available = true}), restored));
  assert(restored.bet == 300);
  assert(restored.bonus_available);
}

void test_wheel_bets() {
  const hogpen::WheelEngine engine(3);
  hogpen::WheelState state{.base_bet = 100, .bets = {}};

  assert(engine.place_bet(state, hogpen::WheelBetType::Straight, 17).ok);
  assert(!engine.place_bet(state, hogpen::WheelBetType::Straight, 17).ok);
  assert(!engine.place_bet(state, hogpen::WheelBetType::Straight, 38).ok);
  assert(engine.place_bet(state, hogpen::WheelBetType::Black).ok);
  assert(!engine.place_bet(state, hogpen::WheelBetType::Black).ok);
  assert(engine.place_bet(state, hogpen::WheelBetType::Even).ok);
  const hogpen::Result full = engine.place_bet(state, hogpen::WheelBetType::Low);
  assert(!full.ok);
  assert(full.code == hogpen::ErrorCode::ValidationError);
  assert(state.total_wagered() == 300);

  assert(hogpen::pocket_color(17) == hogpen::PocketColor::Black);
  assert(hogpen::pocket_color(1) == hogpen::PocketColor::Red);
  assert(hogpen::pocket_color(0) == hogpen::PocketColor::Green);
  assert(hogpen::pocket_color(hogpen::kDoubleZeroPocket) == hogpen::PocketColor::Green);
  assert(hogpen::parse_pocket("00") == hogpen::kDoubleZeroPocket);
  assert(hogpen::parse_pocket("36") == 36);
  assert(!hogpen::parse_pocket("37").has_value());
  assert(hogpen::format_pocket(hogpen::kDoubleZeroPocket) == "00");

  const hogpen::WheelSpin on_17 = engine.evaluate(state, 17);
  assert(on_17.outcomes.size() == 3);
  assert(on_17.outcomes[0].won());
  assert(on_17.outcomes[0].payout == 3600);
  assert(on_17.outcomes[1].won());
  assert(on_17.outcomes[1].payout == 200);
  assert(!on_17.outcomes[2].won());
  assert(on_17.total_payout == 3800);
  assert(on_17.counters.at("wheel_black") == 1);
  assert(on_17.counters.at("straight_wins") == 1);
  assert(on_17.counters.at("bet_even_losses") == 1);

  const hogpen::WheelSpin on_zero = engine.evaluate(state, 0);
  assert(!on_zero.any_won());
  assert(on_zero.total_payout == 0);
  assert(on_zero.counters.at("wheel_green") == 1);

  hogpen::ScriptedRandomSource rng({17});
  assert(engine.spin(state, rng).pocket == 17);

  hogpen::WheelState restored;
  assert(hogpen::WheelEngine::decode_state(hogpen::WheelEngine::encode_state(state), restored));
  assert(restored.bets.size() == 3);
  assert(restored.has_straight(17));
  assert(restored.has_outside(hogpen::WheelBetType::Black));
}

void test_ladder_rounds() {
  using hogpen::Suit;
  const hogpen::LadderEngine engine;
  hogpen::ScriptedRandomSource rng({});

  // A repeated rank on round 2 loses either way.
  for (const hogpen::LadderChoice second : {hogpen::LadderChoice::Higher, hogpen::LadderChoice::Lower}) {
    hogpen::LadderState state;
    assert(engine.deal(100, deck_drawing({card(5, Suit::Spades), card(5, Suit::Hearts)}), rng, state).ok);
    hogpen::LadderStep step;
    assert(engine.guess(state, hogpen::LadderChoice::Black, rng, step).ok);
    assert(step.round_won);
    assert(state.multiplier == 2);
    assert(engine.guess(state, second, rng, step).ok);
    assert(step.finished);
    assert(step.outcome.has_value());
    assert(step.outcome->kind == hogpen::OutcomeKind::Loss);
    assert(step.actual == "tie");
  }

  // Zero shuffle draws S2, CA, CK, CQ.
  hogpen::LadderState ride;
  assert(engine.deal(100, {}, rng, ride).ok);
  hogpen::LadderStep step;
  assert(!engine.guess(ride, hogpen::LadderChoice::Higher, rng, step).ok);
  assert(!engine.cash_out(ride, step).ok);
  assert(engine.guess(ride, hogpen::LadderChoice::Black, rng, step).ok);
  assert(step.counters.at("black_count") == 1);
  assert(engine.guess(ride, hogpen::LadderChoice::Higher, rng, step).ok);
  assert(ride.multiplier == 3);
  assert(engine.guess(ride, hogpen::LadderChoice::Inside, rng, step).ok);
  assert(ride.multiplier == 4);

  hogpen::LadderState cashing = ride;
  hogpen::LadderStep cashed;
  assert(engine.cash_out(cashing, cashed).ok);
  assert(cashed.outcome->kind == hogpen::OutcomeKind::CashOut);
  assert(cashed.outcome->payout == 400);

  assert(engine.guess(ride, hogpen::LadderChoice::Clubs, rng, step).ok);
  assert(step.finished);
  assert(step.outcome->kind == hogpen::OutcomeKind::Win);
  assert(step.outcome->payout == 800);
  assert(step.counters.at("wins_8x") == 1);
  assert(step.counters.at("round_4_wins") == 1);

  hogpen::LadderState restored;
  assert(hogpen::LadderEngine::decode_state(hogpen::LadderEngine::encode_state(cashing), restored));
  assert(restored.stage == cashing.stage);
  assert(restored.cards == cashing.cards);
  assert(hogpen::ladder_choice_from_name("outside") == hogpen::LadderChoice::Outside);
}

}  // namespace

int main() {
  test_deck_and_totals();
  test_random_helpers();
  test_card_duel_natural_and_peek();
  test_card_duel_hit_stand_and_double();
  test_card_duel_split();
  test_card_duel_snapshot();
  test_reel_evaluation();
  test_wheel_bets();
  test_ladder_rounds();

  std::cout << "hogpen game tests passed\n";
  return 0;
}

#include "core/games/wheel.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <utility>

#include "core/util/canonical.hpp"

namespace hogpen {
namespace {

constexpr std::array<int, 18> kRedPockets = {1, 3, 5, 7, 9, 12, 14, 16, 18, 19, 21, 23, 25, 27, 30, 32, 34, 36};

constexpr int kStraightPayout = 35;
constexpr int kOutsidePayout = 1;

bool is_green(int pocket) {
  return pocket == 0 || pocket == kDoubleZeroPocket;
}

std::string bet_prefix(std::size_t index) {
  return "bet." + std::to_string(index) + ".";
}

std::string bet_label(const WheelBet& bet) {
  if (bet.type == WheelBetType::Straight) {
    return "straight " + format_pocket(bet.pocket);
  }
  return std::string{wheel_bet_type_name(bet.type)};
}

}  // namespace

bool WheelBet::covers(int drawn) const {
  return std::ranges::find(covered, drawn) != covered.end();
}

std::int64_t WheelState::total_wagered() const {
  return std::accumulate(bets.begin(), bets.end(), std::int64_t{0},
                         [](std::int64_t sum, const WheelBet& bet) { return sum + bet.amount; });
}

bool WheelState::has_outside(WheelBetType type) const {
  return std::ranges::any_of(bets, [type](const WheelBet& bet) { return bet.type == type; });
}

bool WheelState::has_straight(int pocket) const {
  return std::ranges::any_of(
      bets, [pocket](const WheelBet& bet) { return bet.type == WheelBetType::Straight && bet.pocket == pocket; });
}

bool WheelSpin::any_won() const {
  return std::ranges::any_of(outcomes, [](const GameOutcome& outcome) { return outcome.won(); });
}

PocketColor pocket_color(int pocket) {
  if (is_green(pocket)) {
    return PocketColor::Green;
  }
  return std::ranges::find(kRedPockets, pocket) != kRedPockets.end() ? PocketColor::Red : PocketColor::Black;
}

std::string_view pocket_color_name(PocketColor color) {
  switch (color) {
    case PocketColor::Red:
      return "red";
    case PocketColor::Black:
      return "black";
    case PocketColor::Green:
      return "green";
  }
  return "green";
}

std::string format_pocket(int pocket) {
  return pocket == kDoubleZeroPocket ? "00" : std::to_string(pocket);
}

std::optional<int> parse_pocket(std::string_view text) {
  if (text == "00") {
    return kDoubleZeroPocket;
  }
  std::int64_t value = 0;
  if (!util::parse_int64(text, value) || value < 0 || value > 36) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::string_view wheel_bet_type_name(WheelBetType type) {
  switch (type) {
    case WheelBetType::Straight:
      return "straight";
    case WheelBetType::Red:
      return "red";
    case WheelBetType::Black:
      return "black";
    case WheelBetType::Odd:
      return "odd";
    case WheelBetType::Even:
      return "even";
    case WheelBetType::Low:
      return "low";
    case WheelBetType::High:
      return "high";
  }
  return "red";
}

std::optional<WheelBetType> wheel_bet_type_from_name(std::string_view name) {
  for (const WheelBetType type : {WheelBetType::Straight, WheelBetType::Red, WheelBetType::Black, WheelBetType::Odd,
                                  WheelBetType::Even, WheelBetType::Low, WheelBetType::High}) {
    if (wheel_bet_type_name(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::vector<int> covered_pockets(WheelBetType type, int pocket) {
  std::vector<int> covered;
  switch (type) {
    case WheelBetType::Straight:
      covered.push_back(pocket);
      return covered;
    case WheelBetType::Red:
      return std::vector<int>(kRedPockets.begin(), kRedPockets.end());
    default:
      break;
  }

  for (int n = 1; n <= 36; ++n) {
    const bool hit = (type == WheelBetType::Black && pocket_color(n) == PocketColor::Black) ||
                     (type == WheelBetType::Odd && n % 2 == 1) || (type == WheelBetType::Even && n % 2 == 0) ||
                     (type == WheelBetType::Low && n <= 18) || (type == WheelBetType::High && n >= 19);
    if (hit) {
      covered.push_back(n);
    }
  }
  return covered;
}

Result WheelEngine::place_bet(WheelState& state, WheelBetType type, int pocket) const {
  if (state.base_bet <= 0) {
    return Result::failure("No base bet set for this table.", ErrorCode::ValidationError);
  }
  if (state.bets.size() >= max_bets_) {
    return Result::failure("At most " + std::to_string(max_bets_) + " bets per spin.", ErrorCode::ValidationError);
  }

  if (type == WheelBetType::Straight) {
    if (pocket < 0 || pocket > kDoubleZeroPocket) {
      return Result::failure("Pick a number from 0 to 36 or 00.", ErrorCode::ValidationError);
    }
    if (state.has_straight(pocket)) {
      return Result::failure("You already bet on " + format_pocket(pocket) + ".", ErrorCode::ValidationError);
    }
  } else {
    if (state.has_outside(type)) {
      return Result::failure("You already bet on " + std::string{wheel_bet_type_name(type)} + ".",
                             ErrorCode::ValidationError);
    }
    pocket = -1;
  }

  WheelBet bet{
      .type = type,
      .pocket = pocket,
      .amount = state.base_bet,
      .payout_ratio = type == WheelBetType::Straight ? kStraightPayout : kOutsidePayout,
      .covered = covered_pockets(type, pocket),
  };
  const std::string label = bet_label(bet);
  state.bets.push_back(std::move(bet));
  return Result::success("Bet placed on " + label + ".");
}

int WheelEngine::draw_pocket(RandomSource& rng) const {
  return static_cast<int>(rng.uniform(kWheelPockets));
}

WheelSpin WheelEngine::evaluate(const WheelState& state, int pocket) const {
  WheelSpin spin;
  spin.pocket = pocket;
  spin.counters["wheel_" + std::string{pocket_color_name(pocket_color(pocket))}] = 1;

  for (const WheelBet& bet : state.bets) {
    GameOutcome outcome;
    outcome.wager = bet.amount;
    outcome.label = bet_label(bet);

    const bool won = bet.covers(pocket);
    const std::string type_name{wheel_bet_type_name(bet.type)};
    if (won) {
      outcome.kind = OutcomeKind::Win;
      outcome.payout = bet.amount + (bet.amount * bet.payout_ratio);
      outcome.multiplier = static_cast<double>(bet.payout_ratio + 1);
      spin.counters["bet_" + type_name + "_wins"] += 1;
      if (bet.type == WheelBetType::Straight) {
        spin.counters["straight_wins"] += 1;
      }
    } else {
      outcome.kind = OutcomeKind::Loss;
      spin.counters["bet_" + type_name + "_losses"] += 1;
    }

    spin.total_payout += outcome.payout;
    spin.outcomes.push_back(std::move(outcome));
  }
  return spin;
}

std::string WheelEngine::encode_state(const WheelState& state) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"base_bet", std::to_string(state.base_bet)},
      {"bets", std::to_string(state.bets.size())},
  };
  for (std::size_t idx = 0; idx < state.bets.size(); ++idx) {
    const WheelBet& bet = state.bets[idx];
    const std::string prefix = bet_prefix(idx);
    fields.emplace_back(prefix + "type", std::string{wheel_bet_type_name(bet.type)});
    fields.emplace_back(prefix + "pocket", std::to_string(bet.pocket));
    fields.emplace_back(prefix + "amount", std::to_string(bet.amount));
    fields.emplace_back(prefix + "payout", std::to_string(bet.payout_ratio));
  }
  return util::canonical_join(std::move(fields));
}

bool WheelEngine::decode_state(std::string_view snapshot, WheelState& out) {
  const auto fields = util::parse_canonical_map(snapshot);
  WheelState state;
  state.base_bet = util::int_field_or(fields, "base_bet", -1);
  const std::int64_t count = util::int_field_or(fields, "bets", -1);
  if (state.base_bet <= 0 || count < 0) {
    return false;
  }

  for (std::int64_t idx = 0; idx < count; ++idx) {
    const std::string prefix = bet_prefix(static_cast<std::size_t>(idx));
    const auto type = wheel_bet_type_from_name(util::field_or(fields, prefix + "type"));
    if (!type.has_value()) {
      return false;
    }
    WheelBet bet;
    bet.type = *type;
    bet.pocket = static_cast<int>(util::int_field_or(fields, prefix + "pocket", -1));
    bet.amount = util::int_field_or(fields, prefix + "amount", -1);
    bet.payout_ratio = static_cast<int>(util::int_field_or(fields, prefix + "payout", -1));
    if (bet.amount <= 0 || bet.payout_ratio <= 0 ||
        (bet.type == WheelBetType::Straight && (bet.pocket < 0 || bet.pocket > kDoubleZeroPocket))) {
      return false;
    }
    bet.covered = covered_pockets(bet.type, bet.pocket);
    state.bets.push_back(std::move(bet));
  }

  out = std::move(state);
  return true;
}

}  // namespace hogpen

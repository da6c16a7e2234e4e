#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/games/outcome.hpp"
#include "core/model/types.hpp"
#include "core/rng/random_source.hpp"

namespace hogpen {

enum class WheelBetType {
  Straight,
  Red,
  Black,
  Odd,
  Even,
  Low,
  High,
};

enum class PocketColor {
  Red,
  Black,
  Green,
};

// Pockets 0..36 plus 37 for "00".
inline constexpr int kDoubleZeroPocket = 37;
inline constexpr std::uint32_t kWheelPockets = 38;

struct WheelBet {
  WheelBetType type = WheelBetType::Red;
  int pocket = -1;  // straight bets only
  std::int64_t amount = 0;
  // Profit per unit staked, fixed at placement.
  int payout_ratio = 1;
  std::vector<int> covered;

  [[nodiscard]] bool covers(int drawn) const;
};

struct WheelState {
  std::int64_t base_bet = 0;
  std::vector<WheelBet> bets;

  [[nodiscard]] std::int64_t total_wagered() const;
  [[nodiscard]] bool has_outside(WheelBetType type) const;
  [[nodiscard]] bool has_straight(int pocket) const;
};

struct WheelSpin {
  int pocket = 0;
  // One per bet, in placement order.
  std::vector<GameOutcome> outcomes;
  // Spin-wide counters: pocket color plus per-type wins and losses.
  CounterMap counters;
  std::int64_t total_payout = 0;

  [[nodiscard]] bool any_won() const;
};

class WheelEngine {
public:
  explicit WheelEngine(std::size_t max_bets = 30) : max_bets_(max_bets) {}

  // Stakes the state's base bet on one more selection.
  Result place_bet(WheelState& state, WheelBetType type, int pocket = -1) const;

  [[nodiscard]] int draw_pocket(RandomSource& rng) const;
  [[nodiscard]] WheelSpin evaluate(const WheelState& state, int pocket) const;
  WheelSpin spin(const WheelState& state, RandomSource& rng) const { return evaluate(state, draw_pocket(rng)); }

  [[nodiscard]] std::size_t max_bets() const { return max_bets_; }

  static std::string encode_state(const WheelState& state);
  static bool decode_state(std::string_view snapshot, WheelState& out);

private:
  std::size_t max_bets_;
};

PocketColor pocket_color(int pocket);
std::string_view pocket_color_name(PocketColor color);
std::string format_pocket(int pocket);
// Accepts "0".."36" and "00".
std::optional<int> parse_pocket(std::string_view text);

std::string_view wheel_bet_type_name(WheelBetType type);
std::optional<WheelBetType> wheel_bet_type_from_name(std::string_view name);
std::vector<int> covered_pockets(WheelBetType type, int pocket = -1);

}  // namespace hogpen

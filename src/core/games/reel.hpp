#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/games/outcome.hpp"
#include "core/model/types.hpp"
#include "core/rng/random_source.hpp"

namespace hogpen {

enum class ReelSymbol {
  Hog,
  Tree,
  Bell,
  Snowflake,
  Santa,
  Gift,
};

struct ReelSymbolInfo {
  ReelSymbol symbol;
  std::string_view emoji;
  std::string_view name;
  std::uint32_t weight;  // lower is rarer
};

using ReelLine = std::array<ReelSymbol, 3>;

struct ReelEvaluation {
  int multiplier = 0;
  bool bonus_spin = false;
  bool jackpot_hit = false;
  std::string text;
};

struct ReelState {
  std::int64_t bet = 0;
  int spins_taken = 0;
  bool bonus_available = false;
};

const std::array<ReelSymbolInfo, 6>& reel_symbols();
std::string_view reel_symbol_emoji(ReelSymbol symbol);
std::string format_reel_line(const ReelLine& line);

class ReelEngine {
public:
  // Three independent weighted draws.
  ReelLine spin(RandomSource& rng) const;

  // Hog triple, bonus triples, other triple, hog pair, any pair, nothing; first match wins.
  [[nodiscard]] ReelEvaluation evaluate(const ReelLine& line) const;

  // Payout is bet x multiplier, plus the whole pool on a jackpot. A bonus-spin result on a
  // bonus spin is reported but grants nothing further.
  [[nodiscard]] GameOutcome settle(const ReelLine& line, std::int64_t bet, std::int64_t jackpot_pool,
                                   bool is_bonus_spin) const;

  static std::int64_t jackpot_contribution(std::int64_t bet, std::int64_t percent);

  static std::string encode_state(const ReelState& state);
  static bool decode_state(std::string_view snapshot, ReelState& out);
};

}  // namespace hogpen

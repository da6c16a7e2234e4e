#include "core/games/reel.hpp"

#include <algorithm>
#include <set>

#include "core/util/canonical.hpp"

namespace hogpen {
namespace {

constexpr std::array<ReelSymbolInfo, 6> kReelSymbols = {{
    {ReelSymbol::Hog, "🐷", "Hog", 1},
    {ReelSymbol::Tree, "🎄", "Tree", 2},
    {ReelSymbol::Bell, "🔔", "Bell", 3},
    {ReelSymbol::Snowflake, "❄️", "Snowflake", 3},
    {ReelSymbol::Santa, "🎅", "Santa", 4},
    {ReelSymbol::Gift, "🎁", "Gift", 6},
}};

constexpr int kJackpotMultiplier = 20;
constexpr int kTreeTripleMultiplier = 8;
constexpr int kSnowflakeTripleMultiplier = 6;
constexpr int kTripleMultiplier = 10;
constexpr int kHogPairMultiplier = 5;
constexpr int kPairMultiplier = 2;

bool is_triple(const ReelLine& line, ReelSymbol symbol) {
  return std::ranges::all_of(line, [symbol](ReelSymbol s) { return s == symbol; });
}

}  // namespace

const std::array<ReelSymbolInfo, 6>& reel_symbols() {
  return kReelSymbols;
}

std::string_view reel_symbol_emoji(ReelSymbol symbol) {
  for (const ReelSymbolInfo& info : kReelSymbols) {
    if (info.symbol == symbol) {
      return info.emoji;
    }
  }
  return "?";
}

std::string format_reel_line(const ReelLine& line) {
  std::string out;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out.append(reel_symbol_emoji(line[i]));
  }
  return out;
}

ReelLine ReelEngine::spin(RandomSource& rng) const {
  std::array<std::uint32_t, kReelSymbols.size()> weights{};
  std::ranges::transform(kReelSymbols, weights.begin(), [](const ReelSymbolInfo& info) { return info.weight; });

  ReelLine line{};
  for (ReelSymbol& slot : line) {
    slot = kReelSymbols[weighted_index(weights, rng)].symbol;
  }
  return line;
}

ReelEvaluation ReelEngine::evaluate(const ReelLine& line) const {
  const std::set<ReelSymbol> distinct(line.begin(), line.end());
  const auto hogs = std::ranges::count(line, ReelSymbol::Hog);

  if (is_triple(line, ReelSymbol::Hog)) {
    return {.multiplier = kJackpotMultiplier, .bonus_spin = false, .jackpot_hit = true, .text = "JACKPOT!"};
  }
  if (is_triple(line, ReelSymbol::Tree)) {
    return {.multiplier = kTreeTripleMultiplier, .bonus_spin = true, .jackpot_hit = false,
            .text = "Triple trees! Bonus spin."};
  }
  if (is_triple(line, ReelSymbol::Snowflake)) {
    return {.multiplier = kSnowflakeTripleMultiplier, .bonus_spin = true, .jackpot_hit = false,
            .text = "Triple snowflakes! Bonus spin."};
  }
  if (distinct.size() == 1) {
    return {.multiplier = kTripleMultiplier, .bonus_spin = false, .jackpot_hit = false, .text = "Triple hit!"};
  }
  if (hogs == 2) {
    return {.multiplier = kHogPairMultiplier, .bonus_spin = false, .jackpot_hit = false, .text = "Double hog!"};
  }
  if (distinct.size() == 2) {
    return {.multiplier = kPairMultiplier, .bonus_spin = false, .jackpot_hit = false, .text = "A pair."};
  }
  return {.multiplier = 0, .bonus_spin = false, .jackpot_hit = false, .text = "Nothing lines up."};
}

GameOutcome ReelEngine::settle(const ReelLine& line, std::int64_t bet, std::int64_t jackpot_pool,
                               bool is_bonus_spin) const {
  const ReelEvaluation evaluation = evaluate(line);

  GameOutcome outcome;
  outcome.wager = bet;
  outcome.multiplier = evaluation.multiplier;
  outcome.payout = bet * evaluation.multiplier;
  outcome.flags.bonus_spin = evaluation.bonus_spin;
  outcome.flags.jackpot_hit = evaluation.jackpot_hit;
  outcome.label = format_reel_line(line) + (is_bonus_spin ? " (bonus spin)" : "");

  if (evaluation.jackpot_hit) {
    outcome.kind = OutcomeKind::Jackpot;
    outcome.payout += jackpot_pool;
    outcome.counters["jackpot_hits"] = 1;
  } else {
    outcome.kind = outcome.payout > 0 ? OutcomeKind::Win : OutcomeKind::Loss;
  }
  if (evaluation.bonus_spin) {
    outcome.counters["bonus_spins"] = 1;
  }
  return outcome;
}

std::int64_t ReelEngine::jackpot_contribution(std::int64_t bet, std::int64_t percent) {
  return std::max<std::int64_t>((bet * percent) / 100, 1);
}

std::string ReelEngine::encode_state(const ReelState& state) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"bet", std::to_string(state.bet)},
      {"spins_taken", std::to_string(state.spins_taken)},
      {"bonus_available", state.bonus_available ? "1" : "0"},
  });
}

bool ReelEngine::decode_state(std::string_view snapshot, ReelState& out) {
  const auto fields = util::parse_canonical_map(snapshot);
  ReelState state;
  state.bet = util::int_field_or(fields, "bet", -1);
  state.spins_taken = static_cast<int>(util::int_field_or(fields, "spins_taken", -1));
  state.bonus_available = util::field_or(fields, "bonus_available") == "1";
  if (state.bet <= 0 || state.spins_taken < 0) {
    return false;
  }
  out = state;
  return true;
}

}  // namespace hogpen

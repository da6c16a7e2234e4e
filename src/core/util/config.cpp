#include "core/util/config.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_map>

#include "core/util/canonical.hpp"
#include "core/util/log.hpp"

namespace hogpen::util {
namespace {

constexpr std::array<GameSource, 4> kGameSources = {
    GameSource::CardDuel,
    GameSource::Reel,
    GameSource::Wheel,
    GameSource::Ladder,
};

BetLimits& mutable_limits(CasinoConfig& config, GameSource source) {
  switch (source) {
    case GameSource::Reel:
      return config.reel_limits;
    case GameSource::Wheel:
      return config.wheel_limits;
    case GameSource::Ladder:
      return config.ladder_limits;
    default:
      return config.card_duel_limits;
  }
}

class FieldReader {
public:
  explicit FieldReader(const std::unordered_map<std::string, std::string>& fields) : fields_(fields) {}

  bool read(const std::string& key, std::int64_t& out) {
    const auto it = fields_.find(key);
    if (it == fields_.end()) {
      return true;
    }
    std::int64_t parsed = 0;
    if (!parse_int64(it->second, parsed)) {
      bad_key_ = key;
      return false;
    }
    out = parsed;
    return true;
  }

  bool read(const std::string& key, std::size_t& out) {
    std::int64_t value = static_cast<std::int64_t>(out);
    if (!read(key, value)) {
      return false;
    }
    if (value < 0) {
      bad_key_ = key;
      return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
  }

  bool read(const std::string& key, int& out) {
    std::int64_t value = out;
    if (!read(key, value)) {
      return false;
    }
    out = static_cast<int>(value);
    return true;
  }

  [[nodiscard]] const std::string& bad_key() const { return bad_key_; }

private:
  const std::unordered_map<std::string, std::string>& fields_;
  std::string bad_key_;
};

Result validate(const CasinoConfig& config) {
  if (config.starting_balance < 0) {
    return Result::failure("starting_balance must not be negative.", ErrorCode::ValidationError);
  }
  if (config.beg_min <= 0 || config.beg_max < config.beg_min) {
    return Result::failure("beg_min/beg_max must satisfy 0 < beg_min <= beg_max.", ErrorCode::ValidationError);
  }
  if (config.beg_max - config.beg_min >= std::int64_t{std::numeric_limits<std::uint32_t>::max()}) {
    return Result::failure("beg_max - beg_min must be below 4294967295.", ErrorCode::ValidationError);
  }
  if (config.loan_rate_limit <= 0 || config.loan_window_seconds <= 0) {
    return Result::failure("loan limits must be positive.", ErrorCode::ValidationError);
  }
  if (config.interaction_timeout_seconds <= 0 || config.crash_margin_seconds < 0) {
    return Result::failure("interaction timeout must be positive.", ErrorCode::ValidationError);
  }
  for (const auto& [source, seconds] : config.crash_threshold_overrides) {
    if (seconds <= 0) {
      return Result::failure("crash_threshold." + std::string{game_source_name(source)} + " must be positive.",
                             ErrorCode::ValidationError);
    }
  }
  if (config.dealer_stand_value < 12 || config.dealer_stand_value > 21) {
    return Result::failure("dealer_stand_value must be within 12..21.", ErrorCode::ValidationError);
  }
  if (config.jackpot_seed < 0 || config.jackpot_contribution_percent < 0 ||
      config.jackpot_contribution_percent > 100) {
    return Result::failure("jackpot settings out of range.", ErrorCode::ValidationError);
  }
  for (const GameSource source : kGameSources) {
    const BetLimits& limits = config.limits_for(source);
    if (limits.min_bet <= 0 || limits.max_bet < limits.min_bet) {
      return Result::failure(std::string{game_source_name(source)} + " bet limits must satisfy 0 < min <= max.",
                             ErrorCode::ValidationError);
    }
  }
  if (config.wheel_max_bets == 0) {
    return Result::failure("wheel_max_bets must be positive.", ErrorCode::ValidationError);
  }
  if (config.history_min == 0 || config.history_min > config.history_default ||
      config.history_default > config.history_max) {
    return Result::failure("history limits must satisfy 0 < min <= default <= max.", ErrorCode::ValidationError);
  }
  if (config.prune_keep_days < 0 || config.storage_retry_attempts <= 0) {
    return Result::failure("maintenance settings out of range.", ErrorCode::ValidationError);
  }
  LogLevel level = LogLevel::Info;
  if (!parse_log_level(config.log_level, level)) {
    return Result::failure("log_level must be one of debug, info, warn, error.", ErrorCode::ValidationError);
  }
  return Result::success();
}

}  // namespace

Result parse_casino_config(std::string_view text, CasinoConfig& out) {
  std::unordered_map<std::string, std::string> fields;
  std::istringstream in{std::string{text}};
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto split = trimmed.find('=');
    if (split == std::string::npos) {
      continue;
    }

    fields[trim_copy(trimmed.substr(0, split))] = trim_copy(trimmed.substr(split + 1));
  }

  CasinoConfig parsed = out;
  FieldReader reader{fields};
  bool ok = reader.read("starting_balance", parsed.starting_balance) && reader.read("beg_min", parsed.beg_min) &&
            reader.read("beg_max", parsed.beg_max) && reader.read("loan_rate_limit", parsed.loan_rate_limit) &&
            reader.read("loan_window_seconds", parsed.loan_window_seconds) &&
            reader.read("interaction_timeout_seconds", parsed.interaction_timeout_seconds) &&
            reader.read("crash_margin_seconds", parsed.crash_margin_seconds) &&
            reader.read("dealer_stand_value", parsed.dealer_stand_value) &&
            reader.read("jackpot_seed", parsed.jackpot_seed) &&
            reader.read("jackpot_contribution_percent", parsed.jackpot_contribution_percent) &&
            reader.read("wheel_max_bets", parsed.wheel_max_bets) &&
            reader.read("history_default", parsed.history_default) &&
            reader.read("history_min", parsed.history_min) && reader.read("history_max", parsed.history_max) &&
            reader.read("prune_keep_days", parsed.prune_keep_days) &&
            reader.read("storage_retry_attempts", parsed.storage_retry_attempts);

  for (const GameSource source : kGameSources) {
    if (!ok) {
      break;
    }
    const std::string name{game_source_name(source)};
    BetLimits& limits = mutable_limits(parsed, source);
    ok = reader.read(name + ".min_bet", limits.min_bet) && reader.read(name + ".max_bet", limits.max_bet);
    if (ok && fields.contains("crash_threshold." + name)) {
      std::int64_t seconds = 0;
      ok = reader.read("crash_threshold." + name, seconds);
      parsed.crash_threshold_overrides[source] = seconds;
    }
  }

  if (!ok) {
    return Result::failure("Invalid integer for config key: " + reader.bad_key(), ErrorCode::ValidationError);
  }

  if (fields.contains("log_level")) {
    parsed.log_level = fields["log_level"];
  }

  const Result valid = validate(parsed);
  if (!valid.ok) {
    return valid;
  }

  out = std::move(parsed);
  return Result::success("Casino configuration parsed.");
}

Result load_casino_config(std::string_view path, CasinoConfig& out) {
  std::ifstream in{std::string{path}};
  if (!in) {
    log_info("config", "No config at " + std::string{path} + "; using defaults.");
    return Result::success("Using default casino configuration.");
  }

  std::ostringstream text;
  text << in.rdbuf();
  const Result parsed = parse_casino_config(text.str(), out);
  if (!parsed.ok) {
    return Result::failure(std::string{path} + ": " + parsed.message, parsed.code);
  }
  return Result::success("Loaded casino configuration: " + std::string{path});
}

std::string render_casino_config(const CasinoConfig& config) {
  std::ostringstream out;
  out << "# hogpen casino configuration\n";
  out << "starting_balance=" << config.starting_balance << '\n';
  out << "beg_min=" << config.beg_min << '\n';
  out << "beg_max=" << config.beg_max << '\n';
  out << "loan_rate_limit=" << config.loan_rate_limit << '\n';
  out << "loan_window_seconds=" << config.loan_window_seconds << '\n';
  out << "interaction_timeout_seconds=" << config.interaction_timeout_seconds << '\n';
  out << "crash_margin_seconds=" << config.crash_margin_seconds << '\n';
  for (const auto& [source, seconds] : config.crash_threshold_overrides) {
    out << "crash_threshold." << game_source_name(source) << '=' << seconds << '\n';
  }
  out << "dealer_stand_value=" << config.dealer_stand_value << '\n';
  out << "jackpot_seed=" << config.jackpot_seed << '\n';
  out << "jackpot_contribution_percent=" << config.jackpot_contribution_percent << '\n';
  for (const GameSource source : kGameSources) {
    const BetLimits& limits = config.limits_for(source);
    out << game_source_name(source) << ".min_bet=" << limits.min_bet << '\n';
    out << game_source_name(source) << ".max_bet=" << limits.max_bet << '\n';
  }
  out << "wheel_max_bets=" << config.wheel_max_bets << '\n';
  out << "history_default=" << config.history_default << '\n';
  out << "history_min=" << config.history_min << '\n';
  out << "history_max=" << config.history_max << '\n';
  out << "prune_keep_days=" << config.prune_keep_days << '\n';
  out << "storage_retry_attempts=" << config.storage_retry_attempts << '\n';
  out << "log_level=" << config.log_level << '\n';
  return out.str();
}

}  // namespace hogpen::util

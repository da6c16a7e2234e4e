#include "core/api/core_api.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/config.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace hogpen {

CoreApi::CoreApi() = default;

CoreApi::~CoreApi() {
  if (ranks_ != nullptr) {
    ranks_->wait_idle();
  }
}

Result CoreApi::not_ready() const {
  return Result::failure("Casino core is not initialized.", ErrorCode::Internal);
}

Result CoreApi::init(const InitConfig& config) {
  if (ready_) {
    return Result::failure("Casino core is already initialized.", ErrorCode::ValidationError);
  }
  if (config.data_dir.empty()) {
    return Result::failure("Init failed: data_dir is required.", ErrorCode::ValidationError);
  }

  const Result sodium = util::initialize_sodium();
  if (!sodium.ok) {
    return sodium;
  }

  if (config.casino.has_value()) {
    config_ = *config.casino;
  } else if (!config.config_path.empty()) {
    const Result loaded = util::load_casino_config(config.config_path, config_);
    if (!loaded.ok) {
      return loaded;
    }
  }

  util::LogLevel level = util::LogLevel::Info;
  if (util::parse_log_level(config_.log_level, level)) {
    util::set_log_level(level);
  } else {
    util::log_warn("core", "Unknown log level '" + config_.log_level + "', keeping " +
                               std::string{util::log_level_name(util::log_level())});
  }

  std::error_code ec;
  std::filesystem::create_directories(config.data_dir, ec);
  if (ec) {
    return Result::failure("Init failed: unable to create data_dir: " + ec.message(), ErrorCode::StorageIo);
  }
  data_dir_ = config.data_dir;

  if (config.clock != nullptr) {
    clock_ = config.clock;
  }
  if (config.rng != nullptr) {
    rng_ = config.rng;
  }

  const Result opened = store_.open(data_dir_);
  if (!opened.ok) {
    return opened;
  }

  ledger_ = std::make_unique<WalletLedger>(store_, config_, *clock_);
  sessions_ = std::make_unique<SessionCoordinator>(store_, *ledger_, config_, *clock_);
  stats_ = std::make_unique<StatsAggregator>(store_, config_, *clock_);
  ranks_ = std::make_unique<RankProjector>(store_);
  ranks_->set_role_sink(role_sink_);
  casino_ = std::make_unique<CasinoService>(store_, *ledger_, *sessions_, *stats_, config_, *clock_, *rng_);
  ledger_->set_observer(ranks_.get());

  if (config.recover_on_start) {
    const Result recovered = sessions_->recover_all(recovered_on_start_);
    if (!recovered.ok) {
      return recovered;
    }
  }

  ready_ = true;
  util::log_info("core", std::string{kAppDisplayName} + " " + std::string{kAppVersion} + " ready at " + data_dir_);
  return Result::success("Casino core initialized.");
}

// ---- wallet ----

Result CoreApi::adjust_balance(const BalanceChange& change, std::int64_t& new_balance) {
  return ready_ ? ledger_->adjust_balance(change, new_balance) : not_ready();
}

Result CoreApi::transfer(std::string_view from_user, std::string_view to_user, std::string_view community_id,
                         std::int64_t amount, std::int64_t& from_balance, std::int64_t& to_balance) {
  return ready_ ? ledger_->transfer(from_user, to_user, community_id, amount, from_balance, to_balance)
                : not_ready();
}

Result CoreApi::balance(const PlayerRef& player, std::int64_t& out) {
  return ready_ ? ledger_->balance(player.user_id, player.community_id, out) : not_ready();
}

std::vector<LedgerEntry> CoreApi::balance_history(const PlayerRef& player, std::size_t limit) const {
  if (!ready_) {
    return {};
  }
  return ledger_->balance_history(player.user_id, player.community_id, limit);
}

std::vector<LedgerEntry> CoreApi::recent_transactions(const PlayerRef& player, std::size_t limit) const {
  if (!ready_) {
    return {};
  }
  return ledger_->recent_transactions(player.user_id, player.community_id, limit);
}

Result CoreApi::audit_account(const PlayerRef& player) const {
  return ready_ ? ledger_->audit_account(player.user_id, player.community_id) : not_ready();
}

Result CoreApi::verify_ledger() const {
  return ready_ ? ledger_->verify_ledger() : not_ready();
}

// ---- sessions ----

Result CoreApi::start_game(const PlayerRef& player, GameSource source, std::int64_t bet_amount, std::string snapshot,
                           GameSession& out) {
  return ready_ ? sessions_->start(player, source, bet_amount, std::move(snapshot), out) : not_ready();
}

Result CoreApi::finish_game(const PlayerRef& player, GameSource source) {
  return ready_ ? sessions_->finish(player, source) : not_ready();
}

bool CoreApi::has_active_game(const PlayerRef& player, GameSource source) const {
  return ready_ && sessions_->has_active(player, source);
}

Result CoreApi::check_and_recover(const PlayerRef& player, GameSource source, RecoveryReport& out) {
  return ready_ ? sessions_->check_and_recover(player, source, out) : not_ready();
}

Result CoreApi::recover_all(std::size_t& recovered) {
  return ready_ ? sessions_->recover_all(recovered) : not_ready();
}

Result CoreApi::prune_old_games(std::int64_t days, std::size_t& pruned) {
  return ready_ ? sessions_->prune_old_games(days, pruned) : not_ready();
}

std::vector<CrashRecord> CoreApi::crash_history(const PlayerRef& player) const {
  if (!ready_) {
    return {};
  }
  return sessions_->crash_history(player);
}

// ---- stats ----

Result CoreApi::record_stats(const PlayerRef& player, GameSource source, bool won, std::int64_t bet,
                             std::int64_t payout, const CounterMap& extra) {
  return ready_ ? stats_->record(player, source, won, bet, payout, extra) : not_ready();
}

std::optional<GameStat> CoreApi::stats(const PlayerRef& player, GameSource source) const {
  if (!ready_) {
    return std::nullopt;
  }
  return stats_->stats(player, source);
}

std::vector<GameStat> CoreApi::all_stats(const PlayerRef& player) const {
  if (!ready_) {
    return {};
  }
  return stats_->all_stats(player);
}

WrappedStats CoreApi::wrapped_stats(const PlayerRef& player) const {
  if (!ready_) {
    return {};
  }
  return stats_->wrapped(player);
}

// ---- games ----

Result CoreApi::start_card_duel(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  return ready_ ? casino_->start_card_duel(player, bet, out) : not_ready();
}

Result CoreApi::card_duel_action(const PlayerRef& player, CardDuelAction action, GameReport& out) {
  return ready_ ? casino_->card_duel_action(player, action, out) : not_ready();
}

Result CoreApi::start_reel(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  return ready_ ? casino_->start_reel(player, bet, out) : not_ready();
}

Result CoreApi::crank_reel(const PlayerRef& player, GameReport& out) {
  return ready_ ? casino_->crank_reel(player, out) : not_ready();
}

Result CoreApi::start_wheel(const PlayerRef& player, std::int64_t base_bet, GameReport& out) {
  return ready_ ? casino_->start_wheel(player, base_bet, out) : not_ready();
}

Result CoreApi::place_wheel_bet(const PlayerRef& player, WheelBetType type, int pocket, GameReport& out) {
  return ready_ ? casino_->place_wheel_bet(player, type, pocket, out) : not_ready();
}

Result CoreApi::clear_wheel_bets(const PlayerRef& player, GameReport& out) {
  return ready_ ? casino_->clear_wheel_bets(player, out) : not_ready();
}

Result CoreApi::cancel_wheel(const PlayerRef& player, GameReport& out) {
  return ready_ ? casino_->cancel_wheel(player, out) : not_ready();
}

Result CoreApi::spin_wheel(const PlayerRef& player, GameReport& out) {
  return ready_ ? casino_->spin_wheel(player, out) : not_ready();
}

Result CoreApi::start_ladder(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  return ready_ ? casino_->start_ladder(player, bet, out) : not_ready();
}

Result CoreApi::ladder_guess(const PlayerRef& player, LadderChoice choice, GameReport& out) {
  return ready_ ? casino_->ladder_guess(player, choice, out) : not_ready();
}

Result CoreApi::ladder_cash_out(const PlayerRef& player, GameReport& out) {
  return ready_ ? casino_->ladder_cash_out(player, out) : not_ready();
}

Result CoreApi::expire_game(const PlayerRef& player, GameSource source, GameReport& out) {
  return ready_ ? casino_->expire_game(player, source, out) : not_ready();
}

std::int64_t CoreApi::jackpot_amount(std::string_view community_id) const {
  return ready_ ? casino_->jackpot_amount(community_id) : config_.jackpot_seed;
}

// ---- economy ----

Result CoreApi::beg(const PlayerRef& player, std::int64_t& amount, std::int64_t& new_balance) {
  return ready_ ? casino_->beg(player, amount, new_balance) : not_ready();
}

Result CoreApi::loan(std::string_view lender_id, std::string_view receiver_id, std::string_view community_id,
                     std::int64_t amount, std::int64_t& lender_balance, std::int64_t& receiver_balance) {
  return ready_ ? casino_->loan(lender_id, receiver_id, community_id, amount, lender_balance, receiver_balance)
                : not_ready();
}

// ---- ranks ----

std::vector<LeaderboardEntry> CoreApi::leaderboard(std::string_view community_id, std::size_t limit) const {
  if (!ready_) {
    return {};
  }
  return ranks_->top_accounts(community_id, limit);
}

std::optional<LeaderboardEntry> CoreApi::rank_of(const PlayerRef& player) const {
  if (!ready_) {
    return std::nullopt;
  }
  return ranks_->rank_of(player.user_id, player.community_id);
}

std::optional<LeaderboardEntry> CoreApi::richest(std::string_view community_id) const {
  if (!ready_) {
    return std::nullopt;
  }
  return ranks_->richest(community_id);
}

void CoreApi::set_role_sink(RoleSink* sink) {
  role_sink_ = sink;
  if (ranks_ != nullptr) {
    ranks_->set_role_sink(sink);
  }
}

void CoreApi::wait_for_rank_updates() {
  if (ranks_ != nullptr) {
    ranks_->wait_idle();
  }
}

// ---- maintenance ----

CasinoStatusReport CoreApi::status() const {
  CasinoStatusReport report;
  report.data_dir = data_dir_;
  report.version = std::string{kAppVersion};
  report.recovered_on_start = recovered_on_start_;
  if (ready_) {
    report.journal_path = store_.journal_path();
    report.store = store_.health_report();
  }
  return report;
}

Result CoreApi::compact_journal() {
  return ready_ ? store_.compact() : not_ready();
}

}  // namespace hogpen

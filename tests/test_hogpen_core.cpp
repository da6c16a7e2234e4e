#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/ledger/wallet_ledger.hpp"
#include "core/model/app_meta.hpp"
#include "core/rank/rank_projector.hpp"
#include "core/storage/store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/clock.hpp"
#include "core/util/config.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace {

const hogpen::PlayerRef kAlice{.user_id = "alice", .community_id = "pen"};
const hogpen::PlayerRef kBob{.user_id = "bob", .community_id = "pen"};

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "hogpen-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

hogpen::CasinoConfig quiet_config() {
  hogpen::CasinoConfig config;
  config.log_level = "warn";
  return config;
}

void open_api(hogpen::CoreApi& api, const std::filesystem::path& dir, const hogpen::util::Clock& clock,
              hogpen::RandomSource& rng) {
  const hogpen::Result init = api.init({
      .data_dir = dir.string(),
      .config_path = {},
      .casino = quiet_config(),
      .clock = &clock,
      .rng = &rng,
      .recover_on_start = true,
  });
  assert(init.ok);
}

std::int64_t balance_of(hogpen::CoreApi& api, const hogpen::PlayerRef& player) {
  std::int64_t balance = 0;
  const hogpen::Result read = api.balance(player, balance);
  assert(read.ok);
  return balance;
}

hogpen::BalanceChange admin_change(const hogpen::PlayerRef& player, std::int64_t delta,
                                   hogpen::UpdateKind kind = hogpen::UpdateKind::AdminAdjustment) {
  return hogpen::BalanceChange{
      .user_id = player.user_id,
      .community_id = player.community_id,
      .delta = delta,
      .source = hogpen::GameSource::Admin,
      .kind = kind,
      .metadata = {},
  };
}

// Zero draws until armed, then every draw throws.
class ArmedRandomSource final : public hogpen::RandomSource {
public:
  std::uint32_t uniform(std::uint32_t) override {
    if (armed) {
      throw std::runtime_error("entropy pool exhausted");
    }
    return 0;
  }

  bool armed = false;
};

class RecordingSink final : public hogpen::RoleSink {
public:
  hogpen::Result assign_richest(std::string_view community_id, std::string_view previous_user,
                                std::string_view current_user) override {
    std::lock_guard lock{mutex};
    calls.emplace_back(std::string{community_id}, std::string{previous_user}, std::string{current_user});
    if (fail) {
      return hogpen::Result::failure("role service unavailable");
    }
    return hogpen::Result::success();
  }

  std::mutex mutex;
  std::vector<std::tuple<std::string, std::string, std::string>> calls;
  std::atomic<bool> fail{false};
};

void test_ledger_sum_and_audit() {
  const auto dir = temp_dir("ledger");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  assert(balance_of(api, kAlice) == 10000);

  std::int64_t after = 0;
  assert(api.adjust_balance(admin_change(kAlice, 500), after).ok);
  assert(after == 10500);
  assert(api.adjust_balance(admin_change(kAlice, -200), after).ok);
  assert(after == 10300);

  const hogpen::Result overdraw = api.adjust_balance(admin_change(kAlice, -20000), after);
  assert(!overdraw.ok);
  assert(overdraw.code == hogpen::ErrorCode::InsufficientFunds);
  assert(balance_of(api, kAlice) == 10300);

  const auto entries = api.recent_transactions(kAlice, 100);
  assert(entries.size() == 3);
  assert(entries.front().delta == -200);
  const std::int64_t sum = std::accumulate(entries.begin(), entries.end(), std::int64_t{0},
                                           [](std::int64_t acc, const hogpen::LedgerEntry& e) { return acc + e.delta; });
  assert(sum == 10300);

  assert(api.audit_account(kAlice).ok);
  assert(api.verify_ledger().ok);
  assert(api.balance_history(kAlice, 1).size() == 2);

  const hogpen::Result missing = api.audit_account({.user_id = "ghost", .community_id = "pen"});
  assert(!missing.ok);
  assert(missing.code == hogpen::ErrorCode::AccountNotFound);
}

void test_balance_overflow_rejected() {
  const auto dir = temp_dir("overflow");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  std::int64_t after = -1;
  const hogpen::Result too_big =
      api.adjust_balance(admin_change(kAlice, std::numeric_limits<std::int64_t>::max()), after);
  assert(!too_big.ok);
  assert(too_big.code == hogpen::ErrorCode::ValidationError);
  assert(after == -1);
  assert(balance_of(api, kAlice) == 10000);

  const hogpen::Result too_small =
      api.adjust_balance(admin_change(kAlice, std::numeric_limits<std::int64_t>::min()), after);
  assert(too_small.code == hogpen::ErrorCode::ValidationError);
  assert(balance_of(api, kAlice) == 10000);

  const std::int64_t headroom = std::numeric_limits<std::int64_t>::max() - 10000;
  assert(api.adjust_balance(admin_change(kAlice, headroom), after).ok);
  assert(after == std::numeric_limits<std::int64_t>::max());
  assert(api.adjust_balance(admin_change(kAlice, 1), after).code == hogpen::ErrorCode::ValidationError);
  assert(api.audit_account(kAlice).ok);
}

void test_concurrent_adjustments() {
  const auto dir = temp_dir("concurrent");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  assert(balance_of(api, kAlice) == 10000);

  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&api]() {
      for (int i = 0; i < 25; ++i) {
        std::int64_t after = 0;
        const hogpen::Result adjusted = api.adjust_balance(admin_change(kAlice, 1), after);
        assert(adjusted.ok);
      }
    });
  }
  for (std::thread& worker : workers) {
    worker.join();
  }

  assert(balance_of(api, kAlice) == 10200);
  assert(api.recent_transactions(kAlice, 1000).size() == 201);
  assert(api.audit_account(kAlice).ok);
  assert(api.verify_ledger().ok);
}

void test_stale_session_refunded_once() {
  const auto dir = temp_dir("sessions");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  std::vector<std::string> warnings;
  std::mutex warnings_mutex;
  hogpen::util::set_log_sink([&](hogpen::util::LogLevel level, std::string_view line) {
    if (level == hogpen::util::LogLevel::Warn) {
      std::lock_guard lock{warnings_mutex};
      warnings.emplace_back(line);
    }
  });

  std::int64_t after = 0;
  assert(api.adjust_balance(admin_change(kAlice, -100, hogpen::UpdateKind::BetPlaced), after).ok);
  hogpen::GameSession session;
  assert(api.start_game(kAlice, hogpen::GameSource::CardDuel, 100, "base_bet=100\n", session).ok);
  assert(session.session_id > 0);

  hogpen::GameSession duplicate;
  const hogpen::Result again = api.start_game(kAlice, hogpen::GameSource::CardDuel, 100, {}, duplicate);
  assert(!again.ok);
  assert(again.code == hogpen::ErrorCode::AlreadyActive);
  assert(api.start_game(kAlice, hogpen::GameSource::Reel, 0, {}, duplicate).ok);
  assert(api.finish_game(kAlice, hogpen::GameSource::Reel).ok);

  hogpen::RecoveryReport report;
  assert(api.check_and_recover(kAlice, hogpen::GameSource::CardDuel, report).ok);
  assert(!report.crashed);

  clock.advance(240);
  assert(api.check_and_recover(kAlice, hogpen::GameSource::CardDuel, report).ok);
  assert(report.crashed);
  assert(report.record.refund_amount == 100);
  assert(report.record.crash_reason == "Game timed out after 4 minutes");
  assert(report.record.duration_seconds == 240);
  assert(balance_of(api, kAlice) == 10000);
  assert(!api.has_active_game(kAlice, hogpen::GameSource::CardDuel));

  assert(api.check_and_recover(kAlice, hogpen::GameSource::CardDuel, report).ok);
  assert(!report.crashed);
  std::size_t recovered = 99;
  assert(api.recover_all(recovered).ok);
  assert(recovered == 0);
  assert(balance_of(api, kAlice) == 10000);
  assert(api.crash_history(kAlice).size() == 1);

  hogpen::util::set_log_sink({});
  bool logged_crash = false;
  for (const std::string& line : warnings) {
    logged_crash = logged_crash || line.find("Crashed blackjack session") != std::string::npos;
  }
  assert(logged_crash);

  clock.advance(8 * 24 * 60 * 60);
  std::size_t pruned = 0;
  assert(api.prune_old_games(7, pruned).ok);
  assert(pruned == 2);

  const hogpen::Result huge = api.prune_old_games(std::numeric_limits<std::int64_t>::max(), pruned);
  assert(huge.code == hogpen::ErrorCode::ValidationError);
  assert(pruned == 2);
}

void test_recover_on_start() {
  const auto dir = temp_dir("recover-start");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  {
    hogpen::CoreApi api;
    open_api(api, dir, clock, rng);
    hogpen::GameReport report;
    assert(api.start_ladder(kAlice, 300, report).ok);
    assert(balance_of(api, kAlice) == 9700);
  }

  clock.advance(600);
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  assert(api.status().recovered_on_start == 1);
  assert(balance_of(api, kAlice) == 10000);
  assert(!api.has_active_game(kAlice, hogpen::GameSource::Ladder));
}

void test_transfer_is_all_or_nothing() {
  const auto dir = temp_dir("transfer");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  assert(balance_of(api, kAlice) == 10000);
  assert(balance_of(api, kBob) == 10000);

  api.store().set_fault_hook([](std::string_view point) {
    if (point == "transfer.after_debit") {
      return hogpen::Result::failure("disk unplugged", hogpen::ErrorCode::StorageIo);
    }
    return hogpen::Result::success();
  });

  std::int64_t from_after = 0;
  std::int64_t to_after = 0;
  const hogpen::Result failed = api.transfer("alice", "bob", "pen", 700, from_after, to_after);
  assert(!failed.ok);
  assert(failed.code == hogpen::ErrorCode::StorageIo);
  assert(balance_of(api, kAlice) == 10000);
  assert(balance_of(api, kBob) == 10000);

  api.store().set_fault_hook({});
  assert(api.transfer("alice", "bob", "pen", 700, from_after, to_after).ok);
  assert(from_after == 9300);
  assert(to_after == 10700);

  const hogpen::Result broke = api.transfer("alice", "bob", "pen", 50000, from_after, to_after);
  assert(broke.code == hogpen::ErrorCode::InsufficientFunds);
  assert(api.transfer("alice", "alice", "pen", 10, from_after, to_after).code == hogpen::ErrorCode::ValidationError);
  assert(api.verify_ledger().ok);
}

void test_conflict_is_retried() {
  const auto dir = temp_dir("retry");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  assert(balance_of(api, kAlice) == 10000);

  int commits = 0;
  api.store().set_fault_hook([&commits](std::string_view point) {
    if (point == "commit" && ++commits == 1) {
      return hogpen::Result::failure("write conflict", hogpen::ErrorCode::StorageConflict);
    }
    return hogpen::Result::success();
  });

  std::int64_t after = 0;
  assert(api.adjust_balance(admin_change(kAlice, 250), after).ok);
  assert(commits == 2);
  assert(after == 10250);
  assert(balance_of(api, kAlice) == 10250);
  assert(api.recent_transactions(kAlice, 10).size() == 2);

  api.store().set_fault_hook([](std::string_view point) {
    if (point == "commit") {
      return hogpen::Result::failure("still locked", hogpen::ErrorCode::StorageTimeout);
    }
    return hogpen::Result::success();
  });
  const hogpen::Result gave_up = api.adjust_balance(admin_change(kAlice, 1), after);
  assert(!gave_up.ok);
  assert(gave_up.retryable());
  api.store().set_fault_hook({});
  assert(balance_of(api, kAlice) == 10250);
}

void test_torn_journal_is_dropped() {
  const auto dir = temp_dir("torn");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  {
    hogpen::CoreApi api;
    open_api(api, dir, clock, rng);
    std::int64_t after = 0;
    assert(api.adjust_balance(admin_change(kAlice, 1234), after).ok);
  }

  const auto journal = dir / std::string{hogpen::kJournalFileName};
  {
    std::ofstream out(journal, std::ios::app);
    out << "B\t999\t2\n";
    out << "LEDGER\t" << hogpen::util::to_hex("user=alice\ndelta=99999\n") << "\n";
  }

  hogpen::Store store;
  assert(store.open(dir.string()).ok);
  const auto health = store.health_report();
  assert(health.healthy);
  assert(health.recovered_from_corruption);
  assert(health.dropped_records >= 2);
  assert(store.account("alice", "pen")->balance == 11234);
  assert(store.ledger().size() == 2);

  hogpen::Store reopened;
  assert(reopened.open(dir.string()).ok);
  assert(!reopened.health_report().recovered_from_corruption);
  assert(reopened.account("alice", "pen")->balance == 11234);
}

void test_tampered_entry_fails_verification() {
  const auto dir = temp_dir("tamper");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  {
    hogpen::CoreApi api;
    open_api(api, dir, clock, rng);
    std::int64_t after = 0;
    assert(api.adjust_balance(admin_change(kAlice, -100), after).ok);
    assert(api.verify_ledger().ok);
  }

  const auto journal = dir / std::string{hogpen::kJournalFileName};
  std::vector<std::string> lines;
  {
    std::ifstream in(journal);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
  }

  bool rewritten = false;
  for (std::string& line : lines) {
    if (line.rfind("LEDGER\t", 0) != 0) {
      continue;
    }
    std::string payload = hogpen::util::from_hex(line.substr(7));
    const auto at = payload.find("\ndelta=-100\n");
    if (at != std::string::npos) {
      payload.replace(at, 12, "\ndelta=-1\n");
      line = "LEDGER\t" + hogpen::util::to_hex(payload);
      rewritten = true;
    }
  }
  assert(rewritten);
  {
    std::ofstream out(journal, std::ios::trunc);
    for (const std::string& line : lines) {
      out << line << "\n";
    }
  }

  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  const hogpen::Result verified = api.verify_ledger();
  assert(!verified.ok);
  assert(verified.message.find("does not match its hash") != std::string::npos);
  assert(!api.audit_account(kAlice).ok);
}

void test_streaks_and_wrapped() {
  const auto dir = temp_dir("streaks");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  for (int i = 0; i < 10; ++i) {
    assert(api.record_stats(kAlice, hogpen::GameSource::CardDuel, true, 100, 200, {{"blackjack_wins", 1}}).ok);
  }
  auto stat = api.stats(kAlice, hogpen::GameSource::CardDuel);
  assert(stat.has_value());
  assert(stat->played == 10);
  assert(stat->current_win_streak == 10);
  assert(stat->best_win_streak == 10);
  assert(stat->counters.at("blackjack_wins") == 10);

  assert(api.record_stats(kAlice, hogpen::GameSource::CardDuel, false, 500, 0).ok);
  stat = api.stats(kAlice, hogpen::GameSource::CardDuel);
  assert(stat->current_win_streak == 0);
  assert(stat->best_win_streak == 10);
  assert(stat->current_losing_streak == 1);
  assert(stat->highest_bet == 500);
  assert(stat->highest_loss == 500);
  assert(!api.record_stats(kAlice, hogpen::GameSource::CardDuel, true, -1, 0).ok);

  const hogpen::WrappedStats wrapped = api.wrapped_stats(kAlice);
  assert(wrapped.total_games == 11);
  assert(wrapped.total_won == 10);
  assert(wrapped.best_streak == 10);
  assert(wrapped.favorite_game == hogpen::GameSource::CardDuel);
  assert(wrapped.total_wagered == 0);
}

void test_reel_jackpot_cycle() {
  const auto dir = temp_dir("reel");
  hogpen::util::ManualClock clock;
  // Gift, Santa, Bell on the first crank; zeros (three hogs) afterwards.
  hogpen::ScriptedRandomSource rng({18, 9, 3});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  assert(api.jackpot_amount("pen") == 5000000);
  hogpen::GameReport report;
  const hogpen::Result too_big = api.start_reel(kAlice, 20000, report);
  assert(too_big.code == hogpen::ErrorCode::ValidationError);

  assert(api.start_reel(kAlice, 100, report).ok);
  assert(report.jackpot_amount == 5000100);
  assert(report.balance == 9900);
  assert(api.crank_reel(kAlice, report).ok);
  assert(report.finished);
  assert(report.payout == 0);
  assert(api.jackpot_amount("pen") == 5000100);

  assert(api.start_reel(kAlice, 100, report).ok);
  assert(api.jackpot_amount("pen") == 5000200);
  assert(api.crank_reel(kAlice, report).ok);
  assert(report.outcomes.front().kind == hogpen::OutcomeKind::Jackpot);
  assert(report.payout == 2000 + 5000200);
  assert(report.jackpot_amount == 5000000);
  assert(api.jackpot_amount("pen") == 5000000);
  assert(balance_of(api, kAlice) == 10000 - 200 + 5002200);

  const auto stat = api.stats(kAlice, hogpen::GameSource::Reel);
  assert(stat->played == 2);
  assert(stat->wins == 1);
  assert(stat->counters.at("jackpot_hits") == 1);

  const hogpen::Result no_game = api.crank_reel(kAlice, report);
  assert(no_game.code == hogpen::ErrorCode::NoActiveGame);

  const hogpen::WrappedStats wrapped = api.wrapped_stats(kAlice);
  assert(wrapped.total_wagered == 200);
  assert(wrapped.total_winnings == 5002200);
  assert(wrapped.net_profit == 5002000);
  assert(wrapped.biggest_win == 5002200);
  assert(wrapped.win_rate == 50.0);
  assert(api.audit_account(kAlice).ok);
}

void test_card_duel_flow() {
  const auto dir = temp_dir("card-duel");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.card_duel_action(kAlice, hogpen::CardDuelAction::Hit, report).code ==
         hogpen::ErrorCode::NoActiveGame);
  assert(api.start_card_duel(kAlice, 10, report).code == hogpen::ErrorCode::ValidationError);

  // Player S2 + CA against CK + CQ; doubling draws CJ for 13.
  assert(api.start_card_duel(kAlice, 100, report).ok);
  assert(!report.finished);
  assert(report.outstanding == 100);
  assert(report.balance == 9900);
  const hogpen::Result busy = api.start_card_duel(kAlice, 100, report);
  assert(busy.code == hogpen::ErrorCode::AlreadyActive);
  assert(balance_of(api, kAlice) == 9900);

  assert(api.card_duel_action(kAlice, hogpen::CardDuelAction::Double, report).ok);
  assert(report.finished);
  assert(report.payout == 0);
  assert(report.balance == 9800);
  assert(!api.has_active_game(kAlice, hogpen::GameSource::CardDuel));

  const auto stat = api.stats(kAlice, hogpen::GameSource::CardDuel);
  assert(stat->played == 1);
  assert(stat->losses == 1);
  assert(stat->highest_bet == 200);
  assert(stat->counters.at("double_down_losses") == 1);

  const auto history = api.balance_history(kAlice);
  assert(history.back().kind == hogpen::UpdateKind::BetLost);
  assert(history.back().metadata.at("double_down") == "true");
  for (const hogpen::LedgerEntry& entry : history) {
    assert(entry.kind != hogpen::UpdateKind::BetPlaced);
  }
  assert(api.audit_account(kAlice).ok);
}

void test_card_duel_survives_restart() {
  const auto dir = temp_dir("card-duel-restart");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  {
    hogpen::CoreApi api;
    open_api(api, dir, clock, rng);
    hogpen::GameReport report;
    assert(api.start_card_duel(kAlice, 100, report).ok);
    assert(!report.finished);
  }

  clock.advance(30);
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);
  assert(api.has_active_game(kAlice, hogpen::GameSource::CardDuel));

  hogpen::GameReport report;
  assert(api.card_duel_action(kAlice, hogpen::CardDuelAction::Hit, report).ok);
  assert(!report.finished);
  hogpen::CardDuelState state;
  assert(hogpen::CardDuelEngine::decode_state(report.snapshot, state));
  assert(state.hands.front().cards.size() == 3);
  assert(state.hands.front().total() == 13);

  assert(api.card_duel_action(kAlice, hogpen::CardDuelAction::Stand, report).ok);
  assert(report.finished);
  assert(report.balance == 9900);
}

void test_failed_step_crashes_and_refunds() {
  const auto dir = temp_dir("crash-refund");
  hogpen::util::ManualClock clock;
  ArmedRandomSource rng;
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.start_card_duel(kAlice, 100, report).ok);
  assert(balance_of(api, kAlice) == 9900);

  rng.armed = true;
  const hogpen::Result crashed = api.card_duel_action(kAlice, hogpen::CardDuelAction::Hit, report);
  assert(!crashed.ok);
  assert(crashed.code == hogpen::ErrorCode::CrashDetected);
  assert(crashed.message.find("refunded") != std::string::npos);
  assert(balance_of(api, kAlice) == 10000);
  assert(!api.has_active_game(kAlice, hogpen::GameSource::CardDuel));

  const auto crashes = api.crash_history(kAlice);
  assert(crashes.size() == 1);
  assert(crashes.front().refund_amount == 100);
  assert(crashes.front().crash_reason.find("entropy pool exhausted") != std::string::npos);

  const hogpen::Result nothing = api.start_card_duel(kAlice, 100, report);
  assert(nothing.code == hogpen::ErrorCode::CrashDetected);
  assert(balance_of(api, kAlice) == 10000);
  assert(api.audit_account(kAlice).ok);
}

void test_wheel_flow() {
  const auto dir = temp_dir("wheel");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.start_wheel(kAlice, 100, report).ok);
  assert(report.balance == 10000);
  assert(api.spin_wheel(kAlice, report).code == hogpen::ErrorCode::ValidationError);

  assert(api.place_wheel_bet(kAlice, hogpen::WheelBetType::Black, -1, report).ok);
  assert(report.outstanding == 100);
  assert(api.clear_wheel_bets(kAlice, report).ok);
  assert(report.outstanding == 0);
  assert(report.balance == 10000);

  assert(api.place_wheel_bet(kAlice, hogpen::WheelBetType::Straight, 0, report).ok);
  assert(api.place_wheel_bet(kAlice, hogpen::WheelBetType::Red, -1, report).ok);
  assert(api.place_wheel_bet(kAlice, hogpen::WheelBetType::Red, -1, report).code ==
         hogpen::ErrorCode::ValidationError);
  assert(report.balance == 9800);

  // Zero draw lands on pocket 0.
  assert(api.spin_wheel(kAlice, report).ok);
  assert(report.pocket == 0);
  assert(report.finished);
  assert(report.payout == 3600);
  assert(report.balance == 13400);

  const auto stat = api.stats(kAlice, hogpen::GameSource::Wheel);
  assert(stat->played == 1);
  assert(stat->wins == 1);
  assert(stat->counters.at("wheel_green") == 1);
  assert(stat->counters.at("straight_wins") == 1);
  assert(stat->counters.at("bet_red_losses") == 1);

  assert(api.start_wheel(kAlice, 100, report).ok);
  assert(api.place_wheel_bet(kAlice, hogpen::WheelBetType::High, -1, report).ok);
  assert(api.cancel_wheel(kAlice, report).ok);
  assert(report.finished);
  assert(balance_of(api, kAlice) == 13400);
  assert(api.audit_account(kAlice).ok);
}

void test_ladder_flow() {
  const auto dir = temp_dir("ladder");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.start_ladder(kAlice, 100, report).ok);
  assert(report.balance == 9900);
  assert(api.ladder_cash_out(kAlice, report).code == hogpen::ErrorCode::ValidationError);

  assert(api.ladder_guess(kAlice, hogpen::LadderChoice::Black, report).ok);
  assert(!report.finished);
  assert(report.outstanding == 100);
  assert(report.balance == 9900);

  assert(api.ladder_cash_out(kAlice, report).ok);
  assert(report.finished);
  assert(report.payout == 200);
  assert(report.balance == 10100);

  const auto stat = api.stats(kAlice, hogpen::GameSource::Ladder);
  assert(stat->played == 1);
  assert(stat->wins == 1);
  assert(stat->counters.at("black_count") == 1);
  assert(stat->counters.at("round_1_wins") == 1);

  for (const hogpen::LedgerEntry& entry : api.balance_history(kAlice)) {
    assert(entry.kind != hogpen::UpdateKind::RoundWon);
  }
  bool logged_round = false;
  for (const hogpen::LedgerEntry& entry : api.recent_transactions(kAlice, 10)) {
    logged_round = logged_round || entry.kind == hogpen::UpdateKind::RoundWon;
  }
  assert(logged_round);
}

void test_expired_games() {
  const auto dir = temp_dir("expire");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.start_ladder(kAlice, 100, report).ok);
  assert(api.expire_game(kAlice, hogpen::GameSource::Ladder, report).ok);
  assert(report.finished);
  assert(balance_of(api, kAlice) == 9900);
  assert(api.stats(kAlice, hogpen::GameSource::Ladder)->losses == 1);
  assert(!api.has_active_game(kAlice, hogpen::GameSource::Ladder));

  assert(api.start_wheel(kBob, 100, report).ok);
  assert(api.place_wheel_bet(kBob, hogpen::WheelBetType::Odd, -1, report).ok);
  assert(api.place_wheel_bet(kBob, hogpen::WheelBetType::Straight, 7, report).ok);
  assert(balance_of(api, kBob) == 9800);
  assert(api.expire_game(kBob, hogpen::GameSource::Wheel, report).ok);
  assert(report.payout == 200);
  assert(balance_of(api, kBob) == 10000);
  assert(!api.stats(kBob, hogpen::GameSource::Wheel).has_value());

  assert(api.expire_game(kBob, hogpen::GameSource::Wheel, report).code == hogpen::ErrorCode::NoActiveGame);
}

void test_unreadable_wheel_table_refunded_on_expiry() {
  const auto dir = temp_dir("expire-corrupt");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  hogpen::GameReport report;
  assert(api.start_wheel(kBob, 100, report).ok);
  assert(api.place_wheel_bet(kBob, hogpen::WheelBetType::Odd, -1, report).ok);
  assert(api.place_wheel_bet(kBob, hogpen::WheelBetType::Red, -1, report).ok);
  assert(balance_of(api, kBob) == 9800);

  const hogpen::Result garbled = api.store().run([](hogpen::Store::Transaction& txn) {
    auto session = txn.active_session(kBob.user_id, kBob.community_id, hogpen::GameSource::Wheel);
    assert(session.has_value());
    session->state_snapshot = "not a table";
    return txn.put_session(*session);
  });
  assert(garbled.ok);

  const hogpen::Result expired = api.expire_game(kBob, hogpen::GameSource::Wheel, report);
  assert(!expired.ok);
  assert(expired.code == hogpen::ErrorCode::CrashDetected);
  assert(expired.message.find("200 was refunded") != std::string::npos);
  assert(balance_of(api, kBob) == 10000);
  assert(!api.has_active_game(kBob, hogpen::GameSource::Wheel));
  assert(!api.stats(kBob, hogpen::GameSource::Wheel).has_value());

  const auto crashes = api.crash_history(kBob);
  assert(crashes.size() == 1);
  assert(crashes.front().refund_amount == 200);
  assert(api.audit_account(kBob).ok);
}

void test_beg_and_loans() {
  const auto dir = temp_dir("economy");
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  open_api(api, dir, clock, rng);

  std::int64_t amount = 0;
  std::int64_t after = 0;
  const hogpen::Result refused = api.beg(kAlice, amount, after);
  assert(!refused.ok);
  assert(refused.code == hogpen::ErrorCode::ValidationError);

  assert(api.adjust_balance(admin_change(kAlice, -9990), after).ok);
  assert(api.beg(kAlice, amount, after).ok);
  assert(amount == 500);
  assert(after == 510);
  assert(api.store().account("alice", "pen")->beg_count == 1);
  assert(api.recent_transactions(kAlice, 1).front().metadata.at("beg_count") == "1");

  std::int64_t lender_after = 0;
  std::int64_t receiver_after = 0;
  for (int i = 0; i < 3; ++i) {
    assert(api.loan("bob", "carol", "pen", 100, lender_after, receiver_after).ok);
  }
  assert(lender_after == 9700);
  assert(receiver_after == 10300);

  const hogpen::Result limited = api.loan("bob", "carol", "pen", 100, lender_after, receiver_after);
  assert(limited.code == hogpen::ErrorCode::RateLimited);
  assert(balance_of(api, kBob) == 9700);

  clock.advance(3601);
  assert(api.loan("bob", "carol", "pen", 100, lender_after, receiver_after).ok);
  assert(lender_after == 9600);
}

void test_rank_projection() {
  const auto dir = temp_dir("ranks");
  hogpen::util::ManualClock clock;
  const hogpen::CasinoConfig config = quiet_config();
  hogpen::Store store;
  assert(store.open(dir.string()).ok);
  hogpen::WalletLedger ledger(store, config, clock);
  hogpen::RankProjector ranks(store);
  RecordingSink sink;
  ranks.set_role_sink(&sink);
  ledger.set_observer(&ranks);

  std::int64_t after = 0;
  assert(ledger.adjust_balance(admin_change(kAlice, -100, hogpen::UpdateKind::BetPlaced), after).ok);
  ranks.wait_idle();
  assert(ranks.recompute_count() == 0);
  assert(!ranks.known_richest("pen").has_value());

  assert(ledger.adjust_balance(admin_change(kBob, 500), after).ok);
  ranks.wait_idle();
  assert(ranks.recompute_count() == 1);
  assert(ranks.known_richest("pen") == "bob");
  assert(sink.calls.size() == 1);
  assert(sink.calls.back() == std::make_tuple(std::string{"pen"}, std::string{}, std::string{"bob"}));

  assert(ledger.adjust_balance(admin_change(kAlice, 1000), after).ok);
  ranks.wait_idle();
  assert(ranks.known_richest("pen") == "alice");
  assert(sink.calls.back() == std::make_tuple(std::string{"pen"}, std::string{"bob"}, std::string{"alice"}));

  sink.fail = true;
  assert(ledger.adjust_balance(admin_change(kBob, 5000), after).ok);
  ranks.wait_idle();
  assert(sink.calls.size() == 3);
  assert(ranks.known_richest("pen") == "alice");

  sink.fail = false;
  assert(ledger.adjust_balance(admin_change(kBob, 1), after).ok);
  ranks.wait_idle();
  assert(sink.calls.size() == 4);
  assert(ranks.known_richest("pen") == "bob");

  const auto board = ranks.top_accounts("pen");
  assert(board.size() == 2);
  assert(board[0].user_id == "bob");
  assert(board[0].rank == 1);
  assert(board[0].balance == 15501);
  assert(board[1].user_id == "alice");
  assert(ranks.rank_of("alice", "pen")->rank == 2);
  assert(!ranks.rank_of("ghost", "pen").has_value());
  assert(ranks.top_accounts("pen", 1).size() == 1);
}

void test_config_parsing() {
  hogpen::CasinoConfig config;
  const hogpen::Result parsed = hogpen::util::parse_casino_config(
      "# house rules\n"
      "starting_balance = 2500\n"
      "slots.max_bet=20000\n"
      "crash_threshold.blackjack=90\n"
      "unknown_key=7\n"
      "log_level=warn\n",
      config);
  assert(parsed.ok);
  assert(config.starting_balance == 2500);
  assert(config.reel_limits.max_bet == 20000);
  assert(config.crash_threshold_seconds(hogpen::GameSource::CardDuel) == 90);
  assert(config.crash_threshold_seconds(hogpen::GameSource::Reel) == 240);
  assert(config.log_level == "warn");

  hogpen::CasinoConfig reparsed;
  assert(hogpen::util::parse_casino_config(hogpen::util::render_casino_config(config), reparsed).ok);
  assert(reparsed.starting_balance == 2500);
  assert(reparsed.reel_limits.max_bet == 20000);

  hogpen::CasinoConfig untouched;
  const hogpen::Result bad_int = hogpen::util::parse_casino_config("beg_min=lots\n", untouched);
  assert(!bad_int.ok);
  assert(bad_int.code == hogpen::ErrorCode::ValidationError);
  assert(untouched.beg_min == 500);
  assert(!hogpen::util::parse_casino_config("beg_min=900\nbeg_max=800\n", untouched).ok);
  const hogpen::Result wide_beg =
      hogpen::util::parse_casino_config("beg_min=1\nbeg_max=5000000000\n", untouched);
  assert(wide_beg.code == hogpen::ErrorCode::ValidationError);
  assert(!hogpen::util::parse_casino_config("log_level=loud\n", untouched).ok);

  const auto dir = temp_dir("config");
  assert(hogpen::util::load_casino_config((dir / "missing.conf").string(), untouched).ok);
  {
    std::ofstream out(dir / "casino.conf");
    out << "starting_balance=777\nlog_level=warn\n";
  }
  hogpen::util::ManualClock clock;
  hogpen::ScriptedRandomSource rng({});
  hogpen::CoreApi api;
  assert(api.init({.data_dir = (dir / "data").string(),
                   .config_path = (dir / "casino.conf").string(),
                   .casino = std::nullopt,
                   .clock = &clock,
                   .rng = &rng,
                   .recover_on_start = true})
             .ok);
  assert(balance_of(api, kAlice) == 777);

  const hogpen::CasinoStatusReport status = api.status();
  assert(status.store.healthy);
  assert(status.version == hogpen::kAppVersion);
}

void test_not_ready_api() {
  hogpen::CoreApi api;
  std::int64_t balance = 0;
  assert(!api.balance(kAlice, balance).ok);
  assert(!api.init({.data_dir = {}}).ok);
  assert(api.leaderboard("pen").empty());
}

}  // namespace

int main() {
  const hogpen::Result sodium = hogpen::util::initialize_sodium();
  assert(sodium.ok);

  test_ledger_sum_and_audit();
  test_balance_overflow_rejected();
  test_concurrent_adjustments();
  test_stale_session_refunded_once();
  test_recover_on_start();
  test_transfer_is_all_or_nothing();
  test_conflict_is_retried();
  test_torn_journal_is_dropped();
  test_tampered_entry_fails_verification();
  test_streaks_and_wrapped();
  test_reel_jackpot_cycle();
  test_card_duel_flow();
  test_card_duel_survives_restart();
  test_failed_step_crashes_and_refunds();
  test_wheel_flow();
  test_ladder_flow();
  test_expired_games();
  test_unreadable_wheel_table_refunded_on_expiry();
  test_beg_and_loans();
  test_rank_projection();
  test_config_parsing();
  test_not_ready_api();

  std::cout << "hogpen core tests passed\n";
  return 0;
}

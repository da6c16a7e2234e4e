#include "core/session/session_coordinator.hpp"

#include <utility>

#include "core/util/log.hpp"

namespace hogpen {
namespace {

// A century of retention; larger values would overflow the cutoff arithmetic.
constexpr std::int64_t kMaxRetentionDays = 36500;

std::string session_label(const GameSession& session) {
  return std::string{game_source_name(session.source)} + " session " + std::to_string(session.session_id) + " for " +
         session.user_id + "@" + session.community_id;
}

}  // namespace

SessionCoordinator::SessionCoordinator(Store& store, WalletLedger& ledger, const CasinoConfig& config,
                                       const util::Clock& clock)
    : store_(store), ledger_(ledger), config_(config), clock_(clock) {}

Result SessionCoordinator::start(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                 std::int64_t bet_amount, std::string snapshot, GameSession& out) {
  if (bet_amount < 0) {
    return Result::failure("Bet amount must not be negative.", ErrorCode::ValidationError);
  }

  const std::int64_t now = clock_.now();
  GameSession session{
      .session_id = 0,
      .user_id = player.user_id,
      .community_id = player.community_id,
      .source = source,
      .status = SessionStatus::Active,
      .bet_amount = bet_amount,
      .state_snapshot = std::move(snapshot),
      .crash_reason = {},
      .refund_amount = 0,
      .created_at = now,
      .updated_at = now,
  };

  const Result stored = txn.put_session(session);
  if (!stored.ok) {
    return stored;
  }

  out = session;
  util::log_info("session", "Started " + session_label(session) + " bet=" + std::to_string(bet_amount));
  return Result::success("Game started.", std::to_string(session.session_id));
}

Result SessionCoordinator::start(const PlayerRef& player, GameSource source, std::int64_t bet_amount,
                                 std::string snapshot, GameSession& out) {
  GameSession started;
  const Result result = store_.run(
      [&](Store::Transaction& txn) { return start(txn, player, source, bet_amount, snapshot, started); },
      config_.storage_retry_attempts);
  if (result.ok) {
    out = started;
  }
  return result;
}

Result SessionCoordinator::finish(Store::Transaction& txn, const PlayerRef& player, GameSource source) {
  auto active = txn.active_session(player.user_id, player.community_id, source);
  if (!active.has_value()) {
    return Result::success("No active game to finish.");
  }

  active->status = SessionStatus::Finished;
  active->bet_amount = 0;
  active->updated_at = clock_.now();
  const Result stored = txn.put_session(*active);
  if (!stored.ok) {
    return stored;
  }

  util::log_info("session", "Finished " + session_label(*active));
  return Result::success("Game finished.");
}

Result SessionCoordinator::finish(const PlayerRef& player, GameSource source) {
  return store_.run([&](Store::Transaction& txn) { return finish(txn, player, source); },
                    config_.storage_retry_attempts);
}

Result SessionCoordinator::load_active(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                       GameSession& out) const {
  auto active = txn.active_session(player.user_id, player.community_id, source);
  if (!active.has_value()) {
    return Result::failure("No active " + std::string{game_source_name(source)} + " game.", ErrorCode::NoActiveGame);
  }
  out = std::move(*active);
  return Result::success();
}

Result SessionCoordinator::save_state(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                      std::int64_t outstanding_wager, std::string snapshot) {
  GameSession session;
  const Result loaded = load_active(txn, player, source, session);
  if (!loaded.ok) {
    return loaded;
  }

  session.bet_amount = outstanding_wager;
  session.state_snapshot = std::move(snapshot);
  session.updated_at = clock_.now();
  return txn.put_session(session);
}

bool SessionCoordinator::has_active(const PlayerRef& player, GameSource source) const {
  return store_.active_session(player.user_id, player.community_id, source).has_value();
}

std::optional<GameSession> SessionCoordinator::active_session(const PlayerRef& player, GameSource source) const {
  return store_.active_session(player.user_id, player.community_id, source);
}

Result SessionCoordinator::crash_and_refund(Store::Transaction& txn, GameSession session, std::string reason,
                                            CrashRecord& out) {
  const std::int64_t now = clock_.now();

  CrashRecord record;
  record.user_id = session.user_id;
  record.community_id = session.community_id;
  record.source = session.source;
  record.session_id = session.session_id;
  record.bet_amount = session.bet_amount;
  record.refund_amount = session.bet_amount;
  record.crash_reason = reason;
  record.duration_seconds = now - session.created_at;
  record.state_snapshot = session.state_snapshot;
  record.started_at = session.created_at;
  record.crashed_at = now;
  record = txn.append_crash(std::move(record));

  session.status = SessionStatus::Crashed;
  session.crash_reason = reason;
  session.refund_amount = record.refund_amount;
  session.updated_at = now;
  const Result stored = txn.put_session(session);
  if (!stored.ok) {
    return stored;
  }

  const Result fault = txn.checkpoint("crash.before_refund");
  if (!fault.ok) {
    return fault;
  }

  if (record.refund_amount > 0) {
    const Result refunded = ledger_.apply(txn, BalanceChange{
                                                   .user_id = session.user_id,
                                                   .community_id = session.community_id,
                                                   .delta = record.refund_amount,
                                                   .source = session.source,
                                                   .kind = UpdateKind::CrashRefund,
                                                   .metadata =
                                                       {
                                                           {"session_id", std::to_string(session.session_id)},
                                                           {"crash_reason", reason},
                                                       },
                                               });
    if (!refunded.ok) {
      return refunded;
    }
  }

  util::log_warn("session", "Crashed " + session_label(session) + " refund=" + std::to_string(record.refund_amount) +
                                " duration=" + std::to_string(record.duration_seconds) + "s reason=" + reason);
  out = std::move(record);
  return Result::success("Game crashed and refunded.");
}

Result SessionCoordinator::check_and_recover(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                             RecoveryReport& out) {
  out = RecoveryReport{};
  auto active = txn.active_session(player.user_id, player.community_id, source);
  if (!active.has_value()) {
    return Result::success("No active game.");
  }

  const std::int64_t threshold = config_.crash_threshold_seconds(source);
  if (clock_.now() - active->created_at < threshold) {
    return Result::success("Active game is still within its time limit.");
  }

  const std::string reason = "Game timed out after " + std::to_string(threshold / 60) + " minutes";
  const Result crashed = crash_and_refund(txn, std::move(*active), reason, out.record);
  if (!crashed.ok) {
    return crashed;
  }
  out.crashed = true;
  return Result::success("Stale game crashed and refunded.");
}

Result SessionCoordinator::check_and_recover(const PlayerRef& player, GameSource source, RecoveryReport& out) {
  RecoveryReport report;
  const Result result = store_.run(
      [&](Store::Transaction& txn) { return check_and_recover(txn, player, source, report); },
      config_.storage_retry_attempts);
  if (result.ok) {
    out = report;
  }
  return result;
}

Result SessionCoordinator::force_crash(const PlayerRef& player, GameSource source, std::string_view reason,
                                       RecoveryReport& out) {
  RecoveryReport report;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        report = RecoveryReport{};
        auto active = txn.active_session(player.user_id, player.community_id, source);
        if (!active.has_value()) {
          return Result::success("No active game to crash.");
        }
        const Result crashed = crash_and_refund(txn, std::move(*active), std::string{reason}, report.record);
        report.crashed = crashed.ok;
        return crashed;
      },
      config_.storage_retry_attempts);
  if (result.ok) {
    out = report;
  }
  return result;
}

Result SessionCoordinator::recover_all(std::size_t& recovered) {
  std::size_t count = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        count = 0;
        for (const GameSession& session : txn.sessions()) {
          if (session.status != SessionStatus::Active) {
            continue;
          }
          RecoveryReport report;
          const Result checked = check_and_recover(
              txn, PlayerRef{.user_id = session.user_id, .community_id = session.community_id}, session.source,
              report);
          if (!checked.ok) {
            return checked;
          }
          if (report.crashed) {
            ++count;
          }
        }
        return Result::success();
      },
      config_.storage_retry_attempts);

  if (result.ok) {
    recovered = count;
    if (count > 0) {
      util::log_warn("session", "Recovered " + std::to_string(count) + " stale games.");
    }
  }
  return result;
}

Result SessionCoordinator::prune_old_games(std::int64_t days, std::size_t& pruned) {
  if (days < 0 || days > kMaxRetentionDays) {
    return Result::failure("Retention days must be within 0.." + std::to_string(kMaxRetentionDays) + ".",
                           ErrorCode::ValidationError);
  }

  const std::int64_t cutoff = clock_.now() - (days * 24 * 60 * 60);
  std::size_t count = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        count = 0;
        for (const GameSession& session : txn.sessions()) {
          if (session.status != SessionStatus::Active && session.updated_at < cutoff) {
            txn.delete_session(session.session_id);
            ++count;
          }
        }
        return Result::success();
      },
      config_.storage_retry_attempts);

  if (!result.ok) {
    return result;
  }

  pruned = count;
  util::log_info("session", "Pruned " + std::to_string(count) + " games older than " + std::to_string(days) +
                                " days.");
  return Result::success("Pruned " + std::to_string(count) + " games.");
}

std::vector<CrashRecord> SessionCoordinator::crash_history(const PlayerRef& player) const {
  return store_.crash_records(player.user_id, player.community_id);
}

}  // namespace hogpen

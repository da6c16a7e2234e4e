#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/ledger/wallet_ledger.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"
#include "core/util/clock.hpp"

namespace hogpen {

struct RecoveryReport {
  bool crashed = false;
  CrashRecord record;
};

// Per (user, community, game): none -> active -> finished | crashed.
class SessionCoordinator {
public:
  SessionCoordinator(Store& store, WalletLedger& ledger, const CasinoConfig& config, const util::Clock& clock);

  Result start(const PlayerRef& player, GameSource source, std::int64_t bet_amount, std::string snapshot,
               GameSession& out);
  Result start(Store::Transaction& txn, const PlayerRef& player, GameSource source, std::int64_t bet_amount,
               std::string snapshot, GameSession& out);

  // No-op when nothing is active.
  Result finish(const PlayerRef& player, GameSource source);
  Result finish(Store::Transaction& txn, const PlayerRef& player, GameSource source);

  // Fails with NoActiveGame.
  Result load_active(Store::Transaction& txn, const PlayerRef& player, GameSource source, GameSession& out) const;
  // Stores the outstanding wager and the engine snapshot on the active row.
  Result save_state(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                    std::int64_t outstanding_wager, std::string snapshot);

  [[nodiscard]] bool has_active(const PlayerRef& player, GameSource source) const;
  [[nodiscard]] std::optional<GameSession> active_session(const PlayerRef& player, GameSource source) const;

  // Crashes and refunds an active row older than the game's crash threshold.
  Result check_and_recover(const PlayerRef& player, GameSource source, RecoveryReport& out);
  Result check_and_recover(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                           RecoveryReport& out);

  // Immediate crash and refund, used as the compensating action after a failed game step.
  Result force_crash(const PlayerRef& player, GameSource source, std::string_view reason, RecoveryReport& out);

  // Sweeps every stale active row.
  Result recover_all(std::size_t& recovered);

  // Deletes finished and crashed rows last touched more than `days` ago.
  Result prune_old_games(std::int64_t days, std::size_t& pruned);

  [[nodiscard]] std::vector<CrashRecord> crash_history(const PlayerRef& player) const;
  [[nodiscard]] std::int64_t crash_threshold_seconds(GameSource source) const {
    return config_.crash_threshold_seconds(source);
  }

private:
  Store& store_;
  WalletLedger& ledger_;
  const CasinoConfig& config_;
  const util::Clock& clock_;

  Result crash_and_refund(Store::Transaction& txn, GameSession session, std::string reason, CrashRecord& out);
};

}  // namespace hogpen

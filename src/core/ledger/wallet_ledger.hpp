#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/store.hpp"
#include "core/util/clock.hpp"

namespace hogpen {

struct BalanceChange {
  std::string user_id;
  std::string community_id;
  std::int64_t delta = 0;
  GameSource source = GameSource::Admin;
  UpdateKind kind = UpdateKind::AdminAdjustment;
  Metadata metadata;
};

// Receives committed ledger entries of resolved kinds. Called after the commit, outside
// the store lock, and must not block.
class BalanceObserver {
public:
  virtual ~BalanceObserver() = default;
  virtual void on_resolved_change(const LedgerEntry& entry) = 0;
};

class WalletLedger {
public:
  WalletLedger(Store& store, const CasinoConfig& config, const util::Clock& clock);

  void set_observer(BalanceObserver* observer) { observer_ = observer; }

  Result adjust_balance(const BalanceChange& change, std::int64_t& new_balance);
  Result transfer(std::string_view from_user, std::string_view to_user, std::string_view community_id,
                  std::int64_t amount, std::int64_t& from_balance, std::int64_t& to_balance);

  // Variants folded into a caller's unit of work.
  Result apply(Store::Transaction& txn, const BalanceChange& change, LedgerEntry* out_entry = nullptr);
  Result transfer(Store::Transaction& txn, std::string_view from_user, std::string_view to_user,
                  std::string_view community_id, std::int64_t amount, std::int64_t& from_balance,
                  std::int64_t& to_balance);
  Account ensure_account(Store::Transaction& txn, std::string_view user_id, std::string_view community_id);
  Result increment_beg_count(Store::Transaction& txn, std::string_view user_id, std::string_view community_id);

  // Creates the account on first sight.
  Result balance(std::string_view user_id, std::string_view community_id, std::int64_t& out);
  [[nodiscard]] std::optional<Account> account(std::string_view user_id, std::string_view community_id) const;

  // Last `limit` resolved entries, oldest first. Zero selects the configured default.
  [[nodiscard]] std::vector<LedgerEntry> balance_history(std::string_view user_id, std::string_view community_id,
                                                         std::size_t limit = 0) const;
  // Newest first, every kind.
  [[nodiscard]] std::vector<LedgerEntry> recent_transactions(std::string_view user_id,
                                                             std::string_view community_id,
                                                             std::size_t limit = 10) const;

  // Balance equals the sum of deltas and every balance_after continues from the previous one.
  [[nodiscard]] Result audit_account(std::string_view user_id, std::string_view community_id) const;
  // Recomputes the hash chain over the whole ledger.
  [[nodiscard]] Result verify_ledger() const;

private:
  Store& store_;
  const CasinoConfig& config_;
  const util::Clock& clock_;
  BalanceObserver* observer_ = nullptr;
};

}  // namespace hogpen

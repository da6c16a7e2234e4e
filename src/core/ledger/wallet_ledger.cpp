#include "core/ledger/wallet_ledger.hpp"

#include <algorithm>
#include <ranges>

#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace hogpen {
namespace {

std::string account_label(std::string_view user_id, std::string_view community_id) {
  return std::string{user_id} + "@" + std::string{community_id};
}

}  // namespace

WalletLedger::WalletLedger(Store& store, const CasinoConfig& config, const util::Clock& clock)
    : store_(store), config_(config), clock_(clock) {}

Account WalletLedger::ensure_account(Store::Transaction& txn, std::string_view user_id,
                                     std::string_view community_id) {
  if (auto existing = txn.account(user_id, community_id); existing.has_value()) {
    return *existing;
  }

  const std::int64_t now = clock_.now();
  Account opened{
      .user_id = std::string{user_id},
      .community_id = std::string{community_id},
      .balance = config_.starting_balance,
      .high_water = config_.starting_balance,
      .beg_count = 0,
      .created_at = now,
      .updated_at = now,
  };
  txn.put_account(opened);

  LedgerEntry entry;
  entry.user_id = opened.user_id;
  entry.community_id = opened.community_id;
  entry.delta = opened.balance;
  entry.balance_after = opened.balance;
  entry.source = GameSource::Admin;
  entry.kind = UpdateKind::AccountOpened;
  entry.created_at = now;
  txn.append_ledger(std::move(entry));

  util::log_info("ledger", "Opened account " + account_label(user_id, community_id) + " with " +
                               std::to_string(opened.balance));
  return opened;
}

Result WalletLedger::apply(Store::Transaction& txn, const BalanceChange& change, LedgerEntry* out_entry) {
  if (change.user_id.empty() || change.community_id.empty()) {
    return Result::failure("Balance change needs a user and a community.", ErrorCode::ValidationError);
  }

  ensure_account(txn, change.user_id, change.community_id);

  const std::int64_t now = clock_.now();
  Account updated;
  const Result applied = txn.apply_delta(change.user_id, change.community_id, change.delta, now, updated);
  if (!applied.ok) {
    return applied;
  }

  LedgerEntry entry;
  entry.user_id = change.user_id;
  entry.community_id = change.community_id;
  entry.delta = change.delta;
  entry.balance_after = updated.balance;
  entry.source = change.source;
  entry.kind = change.kind;
  entry.metadata = change.metadata;
  entry.created_at = now;
  const LedgerEntry recorded = txn.append_ledger(std::move(entry));

  util::log_debug("ledger", account_label(change.user_id, change.community_id) + " " +
                                std::string{update_kind_name(change.kind)} + " " + std::to_string(change.delta) +
                                " -> " + std::to_string(updated.balance));

  if (observer_ != nullptr && is_resolved_kind(recorded.kind)) {
    BalanceObserver* observer = observer_;
    txn.on_commit([observer, recorded]() { observer->on_resolved_change(recorded); });
  }

  if (out_entry != nullptr) {
    *out_entry = recorded;
  }
  return Result::success("Balance updated.", std::to_string(updated.balance));
}

Result WalletLedger::adjust_balance(const BalanceChange& change, std::int64_t& new_balance) {
  std::int64_t balance_after = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        LedgerEntry entry;
        const Result applied = apply(txn, change, &entry);
        if (applied.ok) {
          balance_after = entry.balance_after;
        }
        return applied;
      },
      config_.storage_retry_attempts);

  if (result.ok) {
    new_balance = balance_after;
  }
  return result;
}

Result WalletLedger::transfer(Store::Transaction& txn, std::string_view from_user, std::string_view to_user,
                              std::string_view community_id, std::int64_t amount, std::int64_t& from_balance,
                              std::int64_t& to_balance) {
  if (amount <= 0) {
    return Result::failure("Transfer amount must be positive.", ErrorCode::ValidationError);
  }
  if (from_user == to_user) {
    return Result::failure("Cannot transfer to yourself.", ErrorCode::ValidationError);
  }

  const Account sender = ensure_account(txn, from_user, community_id);
  ensure_account(txn, to_user, community_id);
  if (sender.balance < amount) {
    return Result::failure("Insufficient funds: balance " + std::to_string(sender.balance) + ", needs " +
                               std::to_string(amount) + ".",
                           ErrorCode::InsufficientFunds);
  }

  LedgerEntry debit;
  const Result sent = apply(txn,
                            BalanceChange{
                                .user_id = std::string{from_user},
                                .community_id = std::string{community_id},
                                .delta = -amount,
                                .source = GameSource::Loan,
                                .kind = UpdateKind::LoanSent,
                                .metadata = {{"receiver_id", std::string{to_user}}},
                            },
                            &debit);
  if (!sent.ok) {
    return sent;
  }

  const Result fault = txn.checkpoint("transfer.after_debit");
  if (!fault.ok) {
    return fault;
  }

  LedgerEntry credit;
  const Result received = apply(txn,
                                BalanceChange{
                                    .user_id = std::string{to_user},
                                    .community_id = std::string{community_id},
                                    .delta = amount,
                                    .source = GameSource::Loan,
                                    .kind = UpdateKind::LoanReceived,
                                    .metadata = {{"sender_id", std::string{from_user}}},
                                },
                                &credit);
  if (!received.ok) {
    return received;
  }

  from_balance = debit.balance_after;
  to_balance = credit.balance_after;
  return Result::success("Transferred " + std::to_string(amount) + ".");
}

Result WalletLedger::transfer(std::string_view from_user, std::string_view to_user, std::string_view community_id,
                              std::int64_t amount, std::int64_t& from_balance, std::int64_t& to_balance) {
  std::int64_t sender_after = 0;
  std::int64_t receiver_after = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        return transfer(txn, from_user, to_user, community_id, amount, sender_after, receiver_after);
      },
      config_.storage_retry_attempts);

  if (result.ok) {
    from_balance = sender_after;
    to_balance = receiver_after;
  }
  return result;
}

Result WalletLedger::increment_beg_count(Store::Transaction& txn, std::string_view user_id,
                                         std::string_view community_id) {
  Account account = ensure_account(txn, user_id, community_id);
  ++account.beg_count;
  account.updated_at = clock_.now();
  txn.put_account(account);
  return Result::success();
}

Result WalletLedger::balance(std::string_view user_id, std::string_view community_id, std::int64_t& out) {
  if (const auto existing = store_.account(user_id, community_id); existing.has_value()) {
    out = existing->balance;
    return Result::success();
  }

  std::int64_t opened_balance = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        opened_balance = ensure_account(txn, user_id, community_id).balance;
        return Result::success();
      },
      config_.storage_retry_attempts);
  if (result.ok) {
    out = opened_balance;
  }
  return result;
}

std::optional<Account> WalletLedger::account(std::string_view user_id, std::string_view community_id) const {
  return store_.account(user_id, community_id);
}

std::vector<LedgerEntry> WalletLedger::balance_history(std::string_view user_id, std::string_view community_id,
                                                       std::size_t limit) const {
  const std::size_t wanted =
      std::clamp(limit == 0 ? config_.history_default : limit, config_.history_min, config_.history_max);

  std::vector<LedgerEntry> resolved;
  for (LedgerEntry& entry : store_.ledger_for(user_id, community_id)) {
    if (is_resolved_kind(entry.kind)) {
      resolved.push_back(std::move(entry));
    }
  }

  if (resolved.size() > wanted) {
    resolved.erase(resolved.begin(), resolved.end() - static_cast<std::ptrdiff_t>(wanted));
  }
  return resolved;
}

std::vector<LedgerEntry> WalletLedger::recent_transactions(std::string_view user_id, std::string_view community_id,
                                                           std::size_t limit) const {
  std::vector<LedgerEntry> entries = store_.ledger_for(user_id, community_id);
  std::ranges::reverse(entries);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

Result WalletLedger::audit_account(std::string_view user_id, std::string_view community_id) const {
  const auto current = store_.account(user_id, community_id);
  if (!current.has_value()) {
    return Result::failure("Account not found: " + account_label(user_id, community_id), ErrorCode::AccountNotFound);
  }

  std::int64_t running = 0;
  for (const LedgerEntry& entry : store_.ledger_for(user_id, community_id)) {
    running += entry.delta;
    if (entry.balance_after != running) {
      return Result::failure("Ledger entry " + std::to_string(entry.sequence) + " records balance " +
                             std::to_string(entry.balance_after) + " but deltas sum to " + std::to_string(running));
    }
  }

  if (running != current->balance) {
    return Result::failure("Account balance " + std::to_string(current->balance) + " differs from ledger sum " +
                           std::to_string(running));
  }
  return Result::success("Account consistent.", std::to_string(running));
}

Result WalletLedger::verify_ledger() const {
  std::string prev_hash;
  std::size_t checked = 0;
  for (const LedgerEntry& entry : store_.ledger()) {
    if (entry.prev_hash != prev_hash) {
      return Result::failure("Ledger chain broken before entry " + std::to_string(entry.sequence));
    }
    if (util::chain_digest_hex(prev_hash, ledger_hash_payload(entry)) != entry.entry_hash) {
      return Result::failure("Ledger entry " + std::to_string(entry.sequence) + " does not match its hash.");
    }
    prev_hash = entry.entry_hash;
    ++checked;
  }
  return Result::success("Verified " + std::to_string(checked) + " ledger entries.");
}

}  // namespace hogpen

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "core/model/types.hpp"

namespace hogpen {

// Canonical text of a ledger entry, excluding its hashes. Input to the hash chain.
std::string ledger_hash_payload(const LedgerEntry& entry);

class Store {
public:
  using FaultHook = std::function<Result(std::string_view point)>;

  // Unit of work. Holds the store lock for its whole lifetime, reads see its own staged
  // writes, and nothing is visible to others until commit. Destruction without commit
  // discards every staged write.
  class Transaction {
  public:
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    ~Transaction() = default;

    [[nodiscard]] std::optional<Account> account(std::string_view user_id, std::string_view community_id) const;
    void put_account(const Account& account);
    // Read-modify-write of the balance column. Fails with InsufficientFunds below zero.
    Result apply_delta(std::string_view user_id, std::string_view community_id, std::int64_t delta,
                       std::int64_t now, Account& out);

    // Assigns sequence and hash-chain fields.
    LedgerEntry append_ledger(LedgerEntry entry);

    [[nodiscard]] std::optional<GameSession> active_session(std::string_view user_id,
                                                            std::string_view community_id,
                                                            GameSource source) const;
    [[nodiscard]] std::vector<GameSession> sessions() const;
    // Assigns a session id when zero. Fails with AlreadyActive on a second active row.
    Result put_session(GameSession& session);
    void delete_session(std::uint64_t session_id);

    CrashRecord append_crash(CrashRecord record);

    [[nodiscard]] std::optional<GameStat> stat(std::string_view user_id, std::string_view community_id,
                                               GameSource source) const;
    void put_stat(const GameStat& stat);

    [[nodiscard]] JackpotPool jackpot(std::string_view community_id, std::int64_t seed) const;
    JackpotPool jackpot_add(std::string_view community_id, std::int64_t amount, std::int64_t seed);
    JackpotPool jackpot_reset(std::string_view community_id, std::int64_t seed, std::string_view winner,
                              std::int64_t now);

    [[nodiscard]] std::size_t loans_since(std::string_view lender_id, std::string_view community_id,
                                          std::int64_t since) const;
    void add_loan(const LoanRecord& loan);

    // Consults the store's fault hook at a named point.
    Result checkpoint(std::string_view point) const;
    void on_commit(std::function<void()> callback);

  private:
    friend class Store;

    Transaction(Store& store, std::unique_lock<std::timed_mutex> lock);
    Result commit();

    Store& store_;
    std::unique_lock<std::timed_mutex> lock_;
    bool committed_ = false;
    std::uint64_t next_sequence_ = 1;
    std::uint64_t next_session_id_ = 1;
    std::uint64_t next_crash_id_ = 1;
    std::string last_ledger_hash_;
    std::map<std::pair<std::string, std::string>, Account> accounts_;
    std::vector<LedgerEntry> ledger_;
    std::map<std::uint64_t, std::optional<GameSession>> sessions_;
    std::vector<CrashRecord> crashes_;
    std::map<std::tuple<std::string, std::string, GameSource>, GameStat> stats_;
    std::map<std::string, JackpotPool> jackpots_;
    std::vector<LoanRecord> loans_;
    std::vector<std::function<void()>> on_commit_;
  };

  Result open(std::string_view data_dir);

  // Runs fn in a fresh transaction and commits it when fn succeeds. StorageConflict and
  // StorageTimeout are retried up to attempts times; other failures are returned verbatim.
  Result run(const std::function<Result(Transaction&)>& fn, int attempts = 3);

  void set_fault_hook(FaultHook hook);
  void set_lock_timeout(std::chrono::milliseconds timeout);

  // Rewrites the journal as a single batch of the current state.
  Result compact();

  [[nodiscard]] std::optional<Account> account(std::string_view user_id, std::string_view community_id) const;
  [[nodiscard]] std::vector<Account> accounts_in(std::string_view community_id) const;
  [[nodiscard]] std::vector<std::string> communities() const;
  [[nodiscard]] std::vector<LedgerEntry> ledger_for(std::string_view user_id, std::string_view community_id) const;
  [[nodiscard]] std::vector<LedgerEntry> ledger() const;
  [[nodiscard]] std::optional<GameSession> active_session(std::string_view user_id, std::string_view community_id,
                                                          GameSource source) const;
  [[nodiscard]] std::vector<GameSession> sessions() const;
  [[nodiscard]] std::vector<CrashRecord> crash_records(std::string_view user_id,
                                                       std::string_view community_id) const;
  [[nodiscard]] std::optional<GameStat> stat(std::string_view user_id, std::string_view community_id,
                                             GameSource source) const;
  [[nodiscard]] std::vector<GameStat> stats_for(std::string_view user_id, std::string_view community_id) const;
  [[nodiscard]] std::optional<JackpotPool> jackpot(std::string_view community_id) const;
  [[nodiscard]] StoreHealthReport health_report() const;
  [[nodiscard]] const std::string& journal_path() const { return journal_path_; }

private:
  using AccountKey = std::pair<std::string, std::string>;
  using SessionKey = std::tuple<std::string, std::string, GameSource>;

  std::string data_dir_;
  std::string journal_path_;
  mutable std::timed_mutex mutex_;
  std::chrono::milliseconds lock_timeout_{2000};
  FaultHook fault_hook_;

  // Keys are (community, user) so a community's rows are contiguous.
  std::map<AccountKey, Account> accounts_;
  std::vector<LedgerEntry> ledger_;
  std::map<std::uint64_t, GameSession> sessions_;
  std::map<SessionKey, std::uint64_t> active_index_;
  std::vector<CrashRecord> crashes_;
  std::map<SessionKey, GameStat> stats_;
  std::map<std::string, JackpotPool> jackpots_;
  std::vector<LoanRecord> loans_;

  std::uint64_t next_sequence_ = 1;
  std::uint64_t next_session_id_ = 1;
  std::uint64_t next_crash_id_ = 1;
  std::uint64_t next_txid_ = 1;
  std::string last_ledger_hash_;
  std::size_t committed_batches_ = 0;
  std::size_t dropped_records_ = 0;
  bool recovered_from_corruption_ = false;

  static AccountKey account_key(std::string_view user_id, std::string_view community_id);
  static SessionKey session_key(std::string_view user_id, std::string_view community_id, GameSource source);

  void clear_tables();
  Result load_journal();
  Result append_batch(const std::vector<std::pair<std::string, std::string>>& records);
  Result compact_locked();
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> state_records() const;
  bool apply_record(std::string_view type, std::string_view payload, bool dry_run);

  void apply_account(const Account& account);
  void apply_ledger(const LedgerEntry& entry);
  void apply_session(const GameSession& session);
  void apply_session_delete(std::uint64_t session_id);
  void apply_crash(const CrashRecord& record);
  void apply_stat(const GameStat& stat);
  void apply_jackpot(const JackpotPool& pool);
  void apply_loan(const LoanRecord& loan);
};

}  // namespace hogpen

#include "core/storage/store.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"
#include "core/util/log.hpp"

namespace hogpen {
namespace {

using Fields = std::unordered_map<std::string, std::string>;

constexpr std::string_view kJournalTmpSuffix = ".tmp";
constexpr std::string_view kJournalHeader = "# hogpen casino journal v1";

constexpr std::string_view kAccountRecord = "ACCOUNT";
constexpr std::string_view kLedgerRecord = "LEDGER";
constexpr std::string_view kSessionRecord = "SESSION";
constexpr std::string_view kSessionDeleteRecord = "SESSION_DEL";
constexpr std::string_view kCrashRecord = "CRASH";
constexpr std::string_view kStatRecord = "STAT";
constexpr std::string_view kJackpotRecord = "JACKPOT";
constexpr std::string_view kLoanRecord = "LOAN";

bool require_int(const Fields& fields, const std::string& key, std::int64_t& out) {
  const auto it = fields.find(key);
  return it != fields.end() && util::parse_int64(it->second, out);
}

bool require_uint(const Fields& fields, const std::string& key, std::uint64_t& out) {
  const auto it = fields.find(key);
  return it != fields.end() && util::parse_uint64(it->second, out);
}

bool require_text(const Fields& fields, const std::string& key, std::string& out) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty()) {
    return false;
  }
  out = it->second;
  return true;
}

bool require_source(const Fields& fields, GameSource& out) {
  const auto it = fields.find("source");
  if (it == fields.end()) {
    return false;
  }
  const auto parsed = game_source_from_name(it->second);
  if (!parsed.has_value()) {
    return false;
  }
  out = *parsed;
  return true;
}

std::string encode_counters(const CounterMap& counters) {
  std::map<std::string, std::string> text;
  for (const auto& [key, value] : counters) {
    text.emplace(key, std::to_string(value));
  }
  return util::canonical_join(text);
}

bool decode_counters(std::string_view payload, CounterMap& out) {
  out.clear();
  for (const auto& [key, value] : util::parse_canonical_ordered(payload)) {
    std::int64_t parsed = 0;
    if (!util::parse_int64(value, parsed)) {
      return false;
    }
    out.emplace(key, parsed);
  }
  return true;
}

std::string encode_account(const Account& account) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"user", account.user_id},
      {"community", account.community_id},
      {"balance", std::to_string(account.balance)},
      {"high_water", std::to_string(account.high_water)},
      {"beg_count", std::to_string(account.beg_count)},
      {"created_at", std::to_string(account.created_at)},
      {"updated_at", std::to_string(account.updated_at)},
  });
}

bool decode_account(std::string_view payload, Account& out) {
  const Fields fields = util::parse_canonical_map(payload);
  return require_text(fields, "user", out.user_id) && require_text(fields, "community", out.community_id) &&
         require_int(fields, "balance", out.balance) && require_int(fields, "high_water", out.high_water) &&
         require_int(fields, "beg_count", out.beg_count) && require_int(fields, "created_at", out.created_at) &&
         require_int(fields, "updated_at", out.updated_at) && out.balance >= 0;
}

std::string encode_ledger(const LedgerEntry& entry) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"sequence", std::to_string(entry.sequence)},
      {"user", entry.user_id},
      {"community", entry.community_id},
      {"delta", std::to_string(entry.delta)},
      {"balance_after", std::to_string(entry.balance_after)},
      {"source", std::string{game_source_name(entry.source)}},
      {"kind", std::string{update_kind_name(entry.kind)}},
      {"metadata", util::canonical_join(entry.metadata)},
      {"created_at", std::to_string(entry.created_at)},
      {"prev_hash", entry.prev_hash},
      {"entry_hash", entry.entry_hash},
  });
}

bool decode_ledger(std::string_view payload, LedgerEntry& out) {
  const Fields fields = util::parse_canonical_map(payload);
  std::string kind;
  if (!require_uint(fields, "sequence", out.sequence) || !require_text(fields, "user", out.user_id) ||
      !require_text(fields, "community", out.community_id) || !require_int(fields, "delta", out.delta) ||
      !require_int(fields, "balance_after", out.balance_after) || !require_source(fields, out.source) ||
      !require_text(fields, "kind", kind) || !require_int(fields, "created_at", out.created_at) ||
      !require_text(fields, "entry_hash", out.entry_hash)) {
    return false;
  }
  const auto parsed_kind = update_kind_from_name(kind);
  if (!parsed_kind.has_value()) {
    return false;
  }
  out.kind = *parsed_kind;
  out.metadata = util::parse_canonical_ordered(util::field_or(fields, "metadata"));
  out.prev_hash = util::field_or(fields, "prev_hash");
  return true;
}

std::string encode_session(const GameSession& session) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"session_id", std::to_string(session.session_id)},
      {"user", session.user_id},
      {"community", session.community_id},
      {"source", std::string{game_source_name(session.source)}},
      {"status", std::string{session_status_name(session.status)}},
      {"bet_amount", std::to_string(session.bet_amount)},
      {"state", session.state_snapshot},
      {"crash_reason", session.crash_reason},
      {"refund_amount", std::to_string(session.refund_amount)},
      {"created_at", std::to_string(session.created_at)},
      {"updated_at", std::to_string(session.updated_at)},
  });
}

bool decode_session(std::string_view payload, GameSession& out) {
  const Fields fields = util::parse_canonical_map(payload);
  std::string status;
  if (!require_uint(fields, "session_id", out.session_id) || !require_text(fields, "user", out.user_id) ||
      !require_text(fields, "community", out.community_id) || !require_source(fields, out.source) ||
      !require_text(fields, "status", status) || !require_int(fields, "bet_amount", out.bet_amount) ||
      !require_int(fields, "refund_amount", out.refund_amount) ||
      !require_int(fields, "created_at", out.created_at) || !require_int(fields, "updated_at", out.updated_at)) {
    return false;
  }
  const auto parsed_status = session_status_from_name(status);
  if (!parsed_status.has_value()) {
    return false;
  }
  out.status = *parsed_status;
  out.state_snapshot = util::field_or(fields, "state");
  out.crash_reason = util::field_or(fields, "crash_reason");
  return true;
}

std::string encode_crash(const CrashRecord& record) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"crash_id", std::to_string(record.crash_id)},
      {"user", record.user_id},
      {"community", record.community_id},
      {"source", std::string{game_source_name(record.source)}},
      {"session_id", std::to_string(record.session_id)},
      {"bet_amount", std::to_string(record.bet_amount)},
      {"refund_amount", std::to_string(record.refund_amount)},
      {"crash_reason", record.crash_reason},
      {"duration_seconds", std::to_string(record.duration_seconds)},
      {"state", record.state_snapshot},
      {"started_at", std::to_string(record.started_at)},
      {"crashed_at", std::to_string(record.crashed_at)},
  });
}

bool decode_crash(std::string_view payload, CrashRecord& out) {
  const Fields fields = util::parse_canonical_map(payload);
  if (!require_uint(fields, "crash_id", out.crash_id) || !require_text(fields, "user", out.user_id) ||
      !require_text(fields, "community", out.community_id) || !require_source(fields, out.source) ||
      !require_uint(fields, "session_id", out.session_id) || !require_int(fields, "bet_amount", out.bet_amount) ||
      !require_int(fields, "refund_amount", out.refund_amount) ||
      !require_int(fields, "duration_seconds", out.duration_seconds) ||
      !require_int(fields, "started_at", out.started_at) || !require_int(fields, "crashed_at", out.crashed_at)) {
    return false;
  }
  out.crash_reason = util::field_or(fields, "crash_reason");
  out.state_snapshot = util::field_or(fields, "state");
  return true;
}

std::string encode_stat(const GameStat& stat) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"user", stat.user_id},
      {"community", stat.community_id},
      {"source", std::string{game_source_name(stat.source)}},
      {"played", std::to_string(stat.played)},
      {"wins", std::to_string(stat.wins)},
      {"losses", std::to_string(stat.losses)},
      {"current_win_streak", std::to_string(stat.current_win_streak)},
      {"best_win_streak", std::to_string(stat.best_win_streak)},
      {"current_losing_streak", std::to_string(stat.current_losing_streak)},
      {"worst_losing_streak", std::to_string(stat.worst_losing_streak)},
      {"highest_bet", std::to_string(stat.highest_bet)},
      {"highest_payout", std::to_string(stat.highest_payout)},
      {"highest_loss", std::to_string(stat.highest_loss)},
      {"counters", encode_counters(stat.counters)},
      {"updated_at", std::to_string(stat.updated_at)},
  });
}

bool decode_stat(std::string_view payload, GameStat& out) {
  const Fields fields = util::parse_canonical_map(payload);
  return require_text(fields, "user", out.user_id) && require_text(fields, "community", out.community_id) &&
         require_source(fields, out.source) && require_int(fields, "played", out.played) &&
         require_int(fields, "wins", out.wins) && require_int(fields, "losses", out.losses) &&
         require_int(fields, "current_win_streak", out.current_win_streak) &&
         require_int(fields, "best_win_streak", out.best_win_streak) &&
         require_int(fields, "current_losing_streak", out.current_losing_streak) &&
         require_int(fields, "worst_losing_streak", out.worst_losing_streak) &&
         require_int(fields, "highest_bet", out.highest_bet) &&
         require_int(fields, "highest_payout", out.highest_payout) &&
         require_int(fields, "highest_loss", out.highest_loss) &&
         require_int(fields, "updated_at", out.updated_at) &&
         decode_counters(util::field_or(fields, "counters"), out.counters);
}

std::string encode_jackpot(const JackpotPool& pool) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"community", pool.community_id},
      {"amount", std::to_string(pool.amount)},
      {"last_winner", pool.last_winner},
      {"last_won_at", std::to_string(pool.last_won_at)},
  });
}

bool decode_jackpot(std::string_view payload, JackpotPool& out) {
  const Fields fields = util::parse_canonical_map(payload);
  if (!require_text(fields, "community", out.community_id) || !require_int(fields, "amount", out.amount) ||
      !require_int(fields, "last_won_at", out.last_won_at)) {
    return false;
  }
  out.last_winner = util::field_or(fields, "last_winner");
  return true;
}

std::string encode_loan(const LoanRecord& loan) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"lender", loan.lender_id},
      {"community", loan.community_id},
      {"created_at", std::to_string(loan.created_at)},
  });
}

bool decode_loan(std::string_view payload, LoanRecord& out) {
  const Fields fields = util::parse_canonical_map(payload);
  return require_text(fields, "lender", out.lender_id) && require_text(fields, "community", out.community_id) &&
         require_int(fields, "created_at", out.created_at);
}

std::string serialize_batch(std::uint64_t txid, const std::vector<std::pair<std::string, std::string>>& records) {
  std::ostringstream out;
  out << "B\t" << txid << '\t' << records.size() << '\n';
  for (const auto& [type, payload] : records) {
    out << type << '\t' << util::to_hex(payload) << '\n';
  }
  out << "C\t" << txid << '\n';
  return out.str();
}

}  // namespace

std::string ledger_hash_payload(const LedgerEntry& entry) {
  return util::canonical_join(std::vector<std::pair<std::string, std::string>>{
      {"sequence", std::to_string(entry.sequence)},
      {"user", entry.user_id},
      {"community", entry.community_id},
      {"delta", std::to_string(entry.delta)},
      {"balance_after", std::to_string(entry.balance_after)},
      {"source", std::string{game_source_name(entry.source)}},
      {"kind", std::string{update_kind_name(entry.kind)}},
      {"metadata", util::canonical_join(entry.metadata)},
      {"created_at", std::to_string(entry.created_at)},
  });
}

// ---------------------------------------------------------------------------
// Transaction

Store::Transaction::Transaction(Store& store, std::unique_lock<std::timed_mutex> lock)
    : store_(store),
      lock_(std::move(lock)),
      next_sequence_(store.next_sequence_),
      next_session_id_(store.next_session_id_),
      next_crash_id_(store.next_crash_id_),
      last_ledger_hash_(store.last_ledger_hash_) {}

std::optional<Account> Store::Transaction::account(std::string_view user_id, std::string_view community_id) const {
  const AccountKey key = account_key(user_id, community_id);
  if (const auto staged = accounts_.find(key); staged != accounts_.end()) {
    return staged->second;
  }
  if (const auto it = store_.accounts_.find(key); it != store_.accounts_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void Store::Transaction::put_account(const Account& account) {
  accounts_[account_key(account.user_id, account.community_id)] = account;
}

Result Store::Transaction::apply_delta(std::string_view user_id, std::string_view community_id, std::int64_t delta,
                                       std::int64_t now, Account& out) {
  auto current = account(user_id, community_id);
  if (!current.has_value()) {
    return Result::failure("Account not found: " + std::string{user_id} + "@" + std::string{community_id},
                           ErrorCode::AccountNotFound);
  }
  if (delta == std::numeric_limits<std::int64_t>::min() ||
      (delta > 0 && current->balance > std::numeric_limits<std::int64_t>::max() - delta)) {
    return Result::failure("Balance change of " + std::to_string(delta) + " is out of range for balance " +
                               std::to_string(current->balance) + ".",
                           ErrorCode::ValidationError);
  }
  const std::int64_t next_balance = current->balance + delta;
  if (next_balance < 0) {
    return Result::failure("Insufficient funds: balance " + std::to_string(current->balance) + ", needs " +
                               std::to_string(-delta) + ".",
                           ErrorCode::InsufficientFunds);
  }
  current->balance = next_balance;
  current->high_water = std::max(current->high_water, next_balance);
  current->updated_at = now;
  put_account(*current);
  out = *current;
  return Result::success();
}

LedgerEntry Store::Transaction::append_ledger(LedgerEntry entry) {
  entry.sequence = next_sequence_++;
  entry.prev_hash = last_ledger_hash_;
  entry.entry_hash = util::chain_digest_hex(entry.prev_hash, ledger_hash_payload(entry));
  last_ledger_hash_ = entry.entry_hash;
  ledger_.push_back(entry);
  return entry;
}

std::optional<GameSession> Store::Transaction::active_session(std::string_view user_id,
                                                              std::string_view community_id,
                                                              GameSource source) const {
  for (const auto& [id, row] : sessions_) {
    if (row.has_value() && row->status == SessionStatus::Active && row->user_id == user_id &&
        row->community_id == community_id && row->source == source) {
      return row;
    }
  }

  const auto indexed = store_.active_index_.find(session_key(user_id, community_id, source));
  if (indexed == store_.active_index_.end() || sessions_.contains(indexed->second)) {
    return std::nullopt;
  }
  return store_.sessions_.at(indexed->second);
}

std::vector<GameSession> Store::Transaction::sessions() const {
  std::map<std::uint64_t, GameSession> merged = store_.sessions_;
  for (const auto& [id, row] : sessions_) {
    if (row.has_value()) {
      merged[id] = *row;
    } else {
      merged.erase(id);
    }
  }

  std::vector<GameSession> out;
  out.reserve(merged.size());
  for (auto& [id, row] : merged) {
    out.push_back(std::move(row));
  }
  return out;
}

Result Store::Transaction::put_session(GameSession& session) {
  if (session.session_id == 0) {
    session.session_id = next_session_id_++;
  }
  if (session.status == SessionStatus::Active) {
    const auto existing = active_session(session.user_id, session.community_id, session.source);
    if (existing.has_value() && existing->session_id != session.session_id) {
      return Result::failure("An active " + std::string{game_source_name(session.source)} +
                                 " game already exists for this player.",
                             ErrorCode::AlreadyActive);
    }
  }
  sessions_[session.session_id] = session;
  return Result::success();
}

void Store::Transaction::delete_session(std::uint64_t session_id) {
  sessions_[session_id] = std::nullopt;
}

CrashRecord Store::Transaction::append_crash(CrashRecord record) {
  record.crash_id = next_crash_id_++;
  crashes_.push_back(record);
  return record;
}

std::optional<GameStat> Store::Transaction::stat(std::string_view user_id, std::string_view community_id,
                                                 GameSource source) const {
  const SessionKey key = session_key(user_id, community_id, source);
  if (const auto staged = stats_.find(key); staged != stats_.end()) {
    return staged->second;
  }
  if (const auto it = store_.stats_.find(key); it != store_.stats_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void Store::Transaction::put_stat(const GameStat& stat) {
  stats_[session_key(stat.user_id, stat.community_id, stat.source)] = stat;
}

JackpotPool Store::Transaction::jackpot(std::string_view community_id, std::int64_t seed) const {
  const std::string key{community_id};
  if (const auto staged = jackpots_.find(key); staged != jackpots_.end()) {
    return staged->second;
  }
  if (const auto it = store_.jackpots_.find(key); it != store_.jackpots_.end()) {
    return it->second;
  }
  return JackpotPool{.community_id = key, .amount = seed, .last_winner = {}, .last_won_at = 0};
}

JackpotPool Store::Transaction::jackpot_add(std::string_view community_id, std::int64_t amount, std::int64_t seed) {
  JackpotPool pool = jackpot(community_id, seed);
  pool.amount += std::max<std::int64_t>(0, amount);
  jackpots_[pool.community_id] = pool;
  return pool;
}

JackpotPool Store::Transaction::jackpot_reset(std::string_view community_id, std::int64_t seed,
                                              std::string_view winner, std::int64_t now) {
  JackpotPool pool = jackpot(community_id, seed);
  pool.amount = seed;
  pool.last_winner = std::string{winner};
  pool.last_won_at = now;
  jackpots_[pool.community_id] = pool;
  return pool;
}

std::size_t Store::Transaction::loans_since(std::string_view lender_id, std::string_view community_id,
                                            std::int64_t since) const {
  const auto matches = [&](const LoanRecord& loan) {
    return loan.lender_id == lender_id && loan.community_id == community_id && loan.created_at >= since;
  };
  return static_cast<std::size_t>(std::ranges::count_if(store_.loans_, matches) +
                                  std::ranges::count_if(loans_, matches));
}

void Store::Transaction::add_loan(const LoanRecord& loan) {
  loans_.push_back(loan);
}

Result Store::Transaction::checkpoint(std::string_view point) const {
  if (store_.fault_hook_) {
    return store_.fault_hook_(point);
  }
  return Result::success();
}

void Store::Transaction::on_commit(std::function<void()> callback) {
  on_commit_.push_back(std::move(callback));
}

Result Store::Transaction::commit() {
  const Result fault = checkpoint("commit");
  if (!fault.ok) {
    return fault;
  }

  std::vector<std::pair<std::string, std::string>> records;
  for (const auto& [key, row] : accounts_) {
    records.emplace_back(std::string{kAccountRecord}, encode_account(row));
  }
  for (const LedgerEntry& entry : ledger_) {
    records.emplace_back(std::string{kLedgerRecord}, encode_ledger(entry));
  }
  for (const auto& [id, row] : sessions_) {
    if (row.has_value()) {
      records.emplace_back(std::string{kSessionRecord}, encode_session(*row));
    } else {
      records.emplace_back(std::string{kSessionDeleteRecord},
                           util::canonical_join(std::vector<std::pair<std::string, std::string>>{{"session_id", std::to_string(id)}}));
    }
  }
  for (const CrashRecord& record : crashes_) {
    records.emplace_back(std::string{kCrashRecord}, encode_crash(record));
  }
  for (const auto& [key, row] : stats_) {
    records.emplace_back(std::string{kStatRecord}, encode_stat(row));
  }
  for (const auto& [key, pool] : jackpots_) {
    records.emplace_back(std::string{kJackpotRecord}, encode_jackpot(pool));
  }
  for (const LoanRecord& loan : loans_) {
    records.emplace_back(std::string{kLoanRecord}, encode_loan(loan));
  }

  if (!records.empty()) {
    const Result written = store_.append_batch(records);
    if (!written.ok) {
      return written;
    }

    for (const auto& [key, row] : accounts_) {
      store_.apply_account(row);
    }
    for (const LedgerEntry& entry : ledger_) {
      store_.apply_ledger(entry);
    }
    for (const auto& [id, row] : sessions_) {
      if (row.has_value()) {
        store_.apply_session(*row);
      } else {
        store_.apply_session_delete(id);
      }
    }
    for (const CrashRecord& record : crashes_) {
      store_.apply_crash(record);
    }
    for (const auto& [key, row] : stats_) {
      store_.apply_stat(row);
    }
    for (const auto& [key, pool] : jackpots_) {
      store_.apply_jackpot(pool);
    }
    for (const LoanRecord& loan : loans_) {
      store_.apply_loan(loan);
    }
  }

  committed_ = true;
  lock_.unlock();

  for (const auto& callback : on_commit_) {
    try {
      callback();
    } catch (const std::exception& ex) {
      util::log_error("store", std::string{"Post-commit callback failed: "} + ex.what());
    }
  }
  return Result::success();
}

// ---------------------------------------------------------------------------
// Store

Store::AccountKey Store::account_key(std::string_view user_id, std::string_view community_id) {
  return {std::string{community_id}, std::string{user_id}};
}

Store::SessionKey Store::session_key(std::string_view user_id, std::string_view community_id, GameSource source) {
  return {std::string{community_id}, std::string{user_id}, source};
}

Result Store::open(std::string_view data_dir) {
  std::lock_guard lock{mutex_};
  data_dir_ = std::string{data_dir};

  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    return Result::failure("Failed to create store directory: " + ec.message(), ErrorCode::StorageIo);
  }

  journal_path_ = (std::filesystem::path{data_dir_} / std::string{kJournalFileName}).string();
  clear_tables();

  const Result loaded = load_journal();
  if (!loaded.ok) {
    return loaded;
  }

  if (recovered_from_corruption_) {
    util::log_warn("store", "Dropped " + std::to_string(dropped_records_) +
                                " uncommitted or unreadable journal records; compacting.");
    const Result compacted = compact_locked();
    if (!compacted.ok) {
      return compacted;
    }
  }

  util::log_info("store", "Opened journal " + journal_path_ + " with " + std::to_string(ledger_.size()) +
                              " ledger entries.");
  return Result::success("Store opened: " + journal_path_);
}

Result Store::run(const std::function<Result(Transaction&)>& fn, int attempts) {
  Result last = Result::failure("Transaction was not attempted.", ErrorCode::StorageTimeout);
  for (int attempt = 1; attempt <= std::max(1, attempts); ++attempt) {
    std::unique_lock<std::timed_mutex> lock{mutex_, std::defer_lock};
    if (!lock.try_lock_for(lock_timeout_)) {
      last = Result::failure("Timed out waiting for the store lock.", ErrorCode::StorageTimeout);
      util::log_warn("store", "Lock timeout on attempt " + std::to_string(attempt));
      continue;
    }

    Transaction txn{*this, std::move(lock)};
    Result outcome = fn(txn);
    if (!outcome.ok) {
      if (!outcome.retryable()) {
        return outcome;
      }
      last = std::move(outcome);
      util::log_warn("store", "Retrying transaction after " + std::string{error_code_name(last.code)} + ": " +
                                  last.message);
      continue;
    }

    const Result committed = txn.commit();
    if (!committed.ok) {
      if (!committed.retryable()) {
        return committed;
      }
      last = committed;
      util::log_warn("store", "Retrying commit after " + std::string{error_code_name(last.code)} + ": " +
                                  last.message);
      continue;
    }
    return outcome;
  }

  util::log_error("store", "Transaction gave up after " + std::to_string(attempts) + " attempts: " + last.message);
  return last;
}

void Store::set_fault_hook(FaultHook hook) {
  std::lock_guard lock{mutex_};
  fault_hook_ = std::move(hook);
}

void Store::set_lock_timeout(std::chrono::milliseconds timeout) {
  std::lock_guard lock{mutex_};
  lock_timeout_ = timeout;
}

Result Store::compact() {
  std::lock_guard lock{mutex_};
  return compact_locked();
}

void Store::clear_tables() {
  accounts_.clear();
  ledger_.clear();
  sessions_.clear();
  active_index_.clear();
  crashes_.clear();
  stats_.clear();
  jackpots_.clear();
  loans_.clear();
  next_sequence_ = 1;
  next_session_id_ = 1;
  next_crash_id_ = 1;
  next_txid_ = 1;
  last_ledger_hash_.clear();
  committed_batches_ = 0;
  dropped_records_ = 0;
  recovered_from_corruption_ = false;
}

Result Store::load_journal() {
  std::ifstream in(journal_path_);
  if (!in) {
    return Result::success("Journal will be created on first commit.");
  }

  bool in_batch = false;
  std::uint64_t txid = 0;
  std::uint64_t expected = 0;
  std::vector<std::pair<std::string, std::string>> pending;

  const auto drop_pending = [&]() {
    dropped_records_ += pending.size() + 1U;
    recovered_from_corruption_ = true;
    pending.clear();
    in_batch = false;
  };

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }

    const auto fields = util::split_fields(line, '\t');
    if (fields[0] == "B") {
      if (in_batch) {
        drop_pending();
      }
      if (fields.size() != 3 || !util::parse_uint64(fields[1], txid) || !util::parse_uint64(fields[2], expected)) {
        drop_pending();
        continue;
      }
      in_batch = true;
      pending.clear();
      continue;
    }

    if (fields[0] == "C") {
      std::uint64_t closing = 0;
      if (!in_batch || fields.size() != 2 || !util::parse_uint64(fields[1], closing) || closing != txid ||
          pending.size() != expected) {
        drop_pending();
        continue;
      }

      const bool decodable = std::ranges::all_of(pending, [this](const auto& record) {
        return apply_record(record.first, record.second, true);
      });
      if (!decodable) {
        drop_pending();
        continue;
      }
      for (const auto& [type, payload] : pending) {
        apply_record(type, payload, false);
      }
      ++committed_batches_;
      next_txid_ = std::max(next_txid_, txid + 1U);
      pending.clear();
      in_batch = false;
      continue;
    }

    if (!in_batch || fields.size() != 2) {
      ++dropped_records_;
      recovered_from_corruption_ = true;
      continue;
    }
    pending.emplace_back(std::string{fields[0]}, util::from_hex(fields[1]));
  }

  if (in_batch) {
    drop_pending();
  }

  return Result::success("Journal replayed.");
}

bool Store::apply_record(std::string_view type, std::string_view payload, bool dry_run) {
  if (type == kAccountRecord) {
    Account row;
    if (!decode_account(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_account(row);
    }
    return true;
  }
  if (type == kLedgerRecord) {
    LedgerEntry row;
    if (!decode_ledger(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_ledger(row);
    }
    return true;
  }
  if (type == kSessionRecord) {
    GameSession row;
    if (!decode_session(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_session(row);
    }
    return true;
  }
  if (type == kSessionDeleteRecord) {
    std::uint64_t session_id = 0;
    if (!require_uint(util::parse_canonical_map(payload), "session_id", session_id)) {
      return false;
    }
    if (!dry_run) {
      apply_session_delete(session_id);
    }
    return true;
  }
  if (type == kCrashRecord) {
    CrashRecord row;
    if (!decode_crash(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_crash(row);
    }
    return true;
  }
  if (type == kStatRecord) {
    GameStat row;
    if (!decode_stat(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_stat(row);
    }
    return true;
  }
  if (type == kJackpotRecord) {
    JackpotPool row;
    if (!decode_jackpot(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_jackpot(row);
    }
    return true;
  }
  if (type == kLoanRecord) {
    LoanRecord row;
    if (!decode_loan(payload, row)) {
      return false;
    }
    if (!dry_run) {
      apply_loan(row);
    }
    return true;
  }
  return false;
}

Result Store::append_batch(const std::vector<std::pair<std::string, std::string>>& records) {
  const bool fresh = !std::filesystem::exists(journal_path_);
  std::ofstream out(journal_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure("Failed to open journal for append: " + journal_path_, ErrorCode::StorageIo);
  }

  if (fresh) {
    out << kJournalHeader << '\n';
  }
  out << serialize_batch(next_txid_, records);
  out.flush();
  if (!out.good()) {
    return Result::failure("Failed to flush journal: " + journal_path_, ErrorCode::StorageIo);
  }

  ++next_txid_;
  ++committed_batches_;
  return Result::success();
}

std::vector<std::pair<std::string, std::string>> Store::state_records() const {
  std::vector<std::pair<std::string, std::string>> records;
  for (const auto& [key, row] : accounts_) {
    records.emplace_back(std::string{kAccountRecord}, encode_account(row));
  }
  for (const LedgerEntry& entry : ledger_) {
    records.emplace_back(std::string{kLedgerRecord}, encode_ledger(entry));
  }
  for (const auto& [id, row] : sessions_) {
    records.emplace_back(std::string{kSessionRecord}, encode_session(row));
  }
  for (const CrashRecord& record : crashes_) {
    records.emplace_back(std::string{kCrashRecord}, encode_crash(record));
  }
  for (const auto& [key, row] : stats_) {
    records.emplace_back(std::string{kStatRecord}, encode_stat(row));
  }
  for (const auto& [key, pool] : jackpots_) {
    records.emplace_back(std::string{kJackpotRecord}, encode_jackpot(pool));
  }
  for (const LoanRecord& loan : loans_) {
    records.emplace_back(std::string{kLoanRecord}, encode_loan(loan));
  }
  return records;
}

Result Store::compact_locked() {
  const std::string tmp_path = journal_path_ + std::string{kJournalTmpSuffix};
  const auto records = state_records();
  {
    std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      return Result::failure("Failed to write compacted journal: " + tmp_path, ErrorCode::StorageIo);
    }
    out << kJournalHeader << '\n';
    if (!records.empty()) {
      out << serialize_batch(next_txid_, records);
    }
    out.flush();
    if (!out.good()) {
      return Result::failure("Failed to flush compacted journal: " + tmp_path, ErrorCode::StorageIo);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, journal_path_, ec);
  if (ec) {
    return Result::failure("Failed to replace journal: " + ec.message(), ErrorCode::StorageIo);
  }

  if (!records.empty()) {
    ++next_txid_;
  }
  committed_batches_ = records.empty() ? 0 : 1;
  util::log_info("store", "Compacted journal to " + std::to_string(records.size()) + " records.");
  return Result::success("Journal compacted.");
}

void Store::apply_account(const Account& account) {
  accounts_[account_key(account.user_id, account.community_id)] = account;
}

void Store::apply_ledger(const LedgerEntry& entry) {
  ledger_.push_back(entry);
  next_sequence_ = std::max(next_sequence_, entry.sequence + 1U);
  last_ledger_hash_ = entry.entry_hash;
}

void Store::apply_session(const GameSession& session) {
  if (const auto previous = sessions_.find(session.session_id); previous != sessions_.end()) {
    const SessionKey old_key = session_key(previous->second.user_id, previous->second.community_id,
                                           previous->second.source);
    if (const auto indexed = active_index_.find(old_key);
        indexed != active_index_.end() && indexed->second == session.session_id) {
      active_index_.erase(indexed);
    }
  }

  sessions_[session.session_id] = session;
  if (session.status == SessionStatus::Active) {
    active_index_[session_key(session.user_id, session.community_id, session.source)] = session.session_id;
  }
  next_session_id_ = std::max(next_session_id_, session.session_id + 1U);
}

void Store::apply_session_delete(std::uint64_t session_id) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return;
  }
  const SessionKey key = session_key(it->second.user_id, it->second.community_id, it->second.source);
  if (const auto indexed = active_index_.find(key); indexed != active_index_.end() && indexed->second == session_id) {
    active_index_.erase(indexed);
  }
  sessions_.erase(it);
}

void Store::apply_crash(const CrashRecord& record) {
  crashes_.push_back(record);
  next_crash_id_ = std::max(next_crash_id_, record.crash_id + 1U);
}

void Store::apply_stat(const GameStat& stat) {
  stats_[session_key(stat.user_id, stat.community_id, stat.source)] = stat;
}

void Store::apply_jackpot(const JackpotPool& pool) {
  jackpots_[pool.community_id] = pool;
}

void Store::apply_loan(const LoanRecord& loan) {
  loans_.push_back(loan);
}

std::optional<Account> Store::account(std::string_view user_id, std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  const auto it = accounts_.find(account_key(user_id, community_id));
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Account> Store::accounts_in(std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  std::vector<Account> out;
  for (auto it = accounts_.lower_bound({std::string{community_id}, std::string{}});
       it != accounts_.end() && it->first.first == community_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<std::string> Store::communities() const {
  std::lock_guard lock{mutex_};
  std::vector<std::string> out;
  for (const auto& [key, row] : accounts_) {
    if (out.empty() || out.back() != key.first) {
      out.push_back(key.first);
    }
  }
  return out;
}

std::vector<LedgerEntry> Store::ledger_for(std::string_view user_id, std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  std::vector<LedgerEntry> out;
  for (const LedgerEntry& entry : ledger_) {
    if (entry.user_id == user_id && entry.community_id == community_id) {
      out.push_back(entry);
    }
  }
  return out;
}

std::vector<LedgerEntry> Store::ledger() const {
  std::lock_guard lock{mutex_};
  return ledger_;
}

std::optional<GameSession> Store::active_session(std::string_view user_id, std::string_view community_id,
                                                 GameSource source) const {
  std::lock_guard lock{mutex_};
  const auto indexed = active_index_.find(session_key(user_id, community_id, source));
  if (indexed == active_index_.end()) {
    return std::nullopt;
  }
  return sessions_.at(indexed->second);
}

std::vector<GameSession> Store::sessions() const {
  std::lock_guard lock{mutex_};
  std::vector<GameSession> out;
  out.reserve(sessions_.size());
  for (const auto& [id, row] : sessions_) {
    out.push_back(row);
  }
  return out;
}

std::vector<CrashRecord> Store::crash_records(std::string_view user_id, std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  std::vector<CrashRecord> out;
  for (const CrashRecord& record : crashes_) {
    if (record.user_id == user_id && record.community_id == community_id) {
      out.push_back(record);
    }
  }
  return out;
}

std::optional<GameStat> Store::stat(std::string_view user_id, std::string_view community_id,
                                    GameSource source) const {
  std::lock_guard lock{mutex_};
  const auto it = stats_.find(session_key(user_id, community_id, source));
  if (it == stats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<GameStat> Store::stats_for(std::string_view user_id, std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  std::vector<GameStat> out;
  for (const auto& [key, row] : stats_) {
    if (std::get<0>(key) == community_id && std::get<1>(key) == user_id) {
      out.push_back(row);
    }
  }
  return out;
}

std::optional<JackpotPool> Store::jackpot(std::string_view community_id) const {
  std::lock_guard lock{mutex_};
  const auto it = jackpots_.find(std::string{community_id});
  if (it == jackpots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

StoreHealthReport Store::health_report() const {
  std::lock_guard lock{mutex_};
  StoreHealthReport report;
  report.account_count = accounts_.size();
  report.ledger_entry_count = ledger_.size();
  report.session_count = sessions_.size();
  report.active_session_count = active_index_.size();
  report.crash_record_count = crashes_.size();
  report.stat_count = stats_.size();
  report.jackpot_count = jackpots_.size();
  report.committed_batches = committed_batches_;
  report.dropped_records = dropped_records_;
  report.recovered_from_corruption = recovered_from_corruption_;

  std::error_code ec;
  report.journal_bytes = std::filesystem::exists(journal_path_, ec) ? std::filesystem::file_size(journal_path_, ec) : 0;
  report.healthy = !journal_path_.empty() && !ec;
  report.details = report.healthy ? "Journal readable; " + std::to_string(committed_batches_) + " committed batches."
                                  : "Journal unavailable: " + (ec ? ec.message() : std::string{"store not opened"});
  return report;
}

}  // namespace hogpen

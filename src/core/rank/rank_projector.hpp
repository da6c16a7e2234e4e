#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/ledger/wallet_ledger.hpp"
#include "core/model/types.hpp"
#include "core/storage/store.hpp"

namespace hogpen {

// Role side effect for the richest account of a community. `previous` is empty the first
// time a community is seen.
class RoleSink {
public:
  virtual ~RoleSink() = default;
  virtual Result assign_richest(std::string_view community_id, std::string_view previous_user,
                                std::string_view current_user) = 0;
};

class RankProjector final : public BalanceObserver {
public:
  explicit RankProjector(Store& store);
  ~RankProjector() override;

  RankProjector(const RankProjector&) = delete;
  RankProjector& operator=(const RankProjector&) = delete;

  void set_role_sink(RoleSink* sink);

  void on_resolved_change(const LedgerEntry& entry) override;

  // Queues a recompute for the community and returns immediately.
  void notify(std::string community_id);
  // Blocks until the queue is drained and the worker is idle.
  void wait_idle();

  // Accounts with a positive balance, richest first, ranks from 1.
  [[nodiscard]] std::vector<LeaderboardEntry> top_accounts(std::string_view community_id,
                                                           std::size_t limit = 10) const;
  [[nodiscard]] std::optional<LeaderboardEntry> rank_of(std::string_view user_id,
                                                        std::string_view community_id) const;
  [[nodiscard]] std::optional<LeaderboardEntry> richest(std::string_view community_id) const;

  [[nodiscard]] std::optional<std::string> known_richest(std::string_view community_id) const;
  [[nodiscard]] std::size_t recompute_count() const { return recomputes_.load(); }

private:
  Store& store_;

  mutable std::mutex mutex_;
  std::condition_variable_any work_cv_;
  std::condition_variable idle_cv_;
  std::deque<std::string> queue_;
  bool busy_ = false;
  std::map<std::string, std::string, std::less<>> last_richest_;
  RoleSink* sink_ = nullptr;
  std::atomic<std::size_t> recomputes_{0};

  std::jthread worker_;

  void run(std::stop_token stop);
  void recompute(const std::string& community_id);
  [[nodiscard]] std::vector<LeaderboardEntry> ranked(std::string_view community_id) const;
};

}  // namespace hogpen

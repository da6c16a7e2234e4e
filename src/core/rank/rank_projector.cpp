#include "core/rank/rank_projector.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/util/log.hpp"

namespace hogpen {

RankProjector::RankProjector(Store& store) : store_(store) {
  worker_ = std::jthread([this](std::stop_token stop) { run(std::move(stop)); });
}

RankProjector::~RankProjector() {
  worker_.request_stop();
  work_cv_.notify_all();
}

void RankProjector::set_role_sink(RoleSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink;
}

void RankProjector::on_resolved_change(const LedgerEntry& entry) {
  notify(entry.community_id);
}

void RankProjector::notify(std::string community_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::ranges::find(queue_, community_id) != queue_.end()) {
      return;
    }
    queue_.push_back(std::move(community_id));
  }
  work_cv_.notify_one();
}

void RankProjector::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void RankProjector::run(std::stop_token stop) {
  while (true) {
    std::string community_id;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (!work_cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
        break;
      }
      community_id = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    recompute(community_id);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
  busy_ = false;
  idle_cv_.notify_all();
}

void RankProjector::recompute(const std::string& community_id) {
  recomputes_.fetch_add(1);
  const auto top = richest(community_id);
  if (!top.has_value()) {
    util::log_debug("rank", "No ranked accounts in " + community_id);
    return;
  }

  std::string previous;
  RoleSink* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = last_richest_.find(community_id);
    if (it != last_richest_.end()) {
      if (it->second == top->user_id) {
        return;
      }
      previous = it->second;
    }
    sink = sink_;
  }

  if (sink != nullptr) {
    Result assigned;
    try {
      assigned = sink->assign_richest(community_id, previous, top->user_id);
    } catch (const std::exception& ex) {
      assigned = Result::failure(ex.what());
    }
    if (!assigned.ok) {
      util::log_error("rank", "Role update for " + community_id + " dropped: " + assigned.message);
      return;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_richest_[community_id] = top->user_id;
  }
  util::log_info("rank", "Richest in " + community_id + " is now " + top->user_id + " (" +
                             std::to_string(top->balance) + ")");
}

std::vector<LeaderboardEntry> RankProjector::ranked(std::string_view community_id) const {
  std::vector<Account> accounts = store_.accounts_in(community_id);
  std::erase_if(accounts, [](const Account& account) { return account.balance <= 0; });
  std::ranges::sort(accounts, [](const Account& lhs, const Account& rhs) {
    if (lhs.balance != rhs.balance) {
      return lhs.balance > rhs.balance;
    }
    return lhs.user_id < rhs.user_id;
  });

  std::vector<LeaderboardEntry> entries;
  entries.reserve(accounts.size());
  for (std::size_t idx = 0; idx < accounts.size(); ++idx) {
    entries.push_back(LeaderboardEntry{.rank = idx + 1, .user_id = accounts[idx].user_id,
                                       .balance = accounts[idx].balance});
  }
  return entries;
}

std::vector<LeaderboardEntry> RankProjector::top_accounts(std::string_view community_id, std::size_t limit) const {
  std::vector<LeaderboardEntry> entries = ranked(community_id);
  if (entries.size() > limit) {
    entries.resize(limit);
  }
  return entries;
}

std::optional<LeaderboardEntry> RankProjector::rank_of(std::string_view user_id,
                                                       std::string_view community_id) const {
  for (LeaderboardEntry& entry : ranked(community_id)) {
    if (entry.user_id == user_id) {
      return std::move(entry);
    }
  }
  return std::nullopt;
}

std::optional<LeaderboardEntry> RankProjector::richest(std::string_view community_id) const {
  std::vector<LeaderboardEntry> entries = top_accounts(community_id, 1);
  if (entries.empty()) {
    return std::nullopt;
  }
  return std::move(entries.front());
}

std::optional<std::string> RankProjector::known_richest(std::string_view community_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = last_richest_.find(community_id);
  if (it == last_richest_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace hogpen

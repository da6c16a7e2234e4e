#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/api/core_api.hpp"
#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace {

struct CliOptions {
  std::string data_dir = "hogpen-data";
  std::string config_path;
  std::vector<std::string> args;
};

void print_usage() {
  std::cerr << "usage: hogpen_cli [--data <dir>] [--config <file>] <command>\n"
               "  balance <user> <community>\n"
               "  history <user> <community> [n]\n"
               "  leaderboard <community> [n]\n"
               "  stats <user> <community>\n"
               "  recover\n"
               "  prune [days]\n"
               "  verify\n"
               "  health\n";
}

bool parse_options(int argc, char** argv, CliOptions& out) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if ((arg == "--data" || arg == "--config") && i + 1 < argc) {
      (arg == "--data" ? out.data_dir : out.config_path) = argv[++i];
    } else if (arg.starts_with("--")) {
      std::cerr << "unknown option " << arg << '\n';
      return false;
    } else {
      out.args.emplace_back(arg);
    }
  }
  return !out.args.empty();
}

bool parse_count(const std::vector<std::string>& args, std::size_t index, std::int64_t fallback,
                 std::int64_t& out) {
  if (args.size() <= index) {
    out = fallback;
    return true;
  }
  return hogpen::util::parse_int64(args[index], out) && out >= 0;
}

int report(const hogpen::Result& result) {
  if (!result.ok) {
    std::cerr << "error (" << hogpen::error_code_name(result.code) << "): " << result.message << '\n';
    return 1;
  }
  if (!result.message.empty()) {
    std::cout << result.message << '\n';
  }
  return 0;
}

void print_entry(const hogpen::LedgerEntry& entry) {
  std::cout << '#' << entry.sequence << ' ' << hogpen::update_kind_name(entry.kind) << ' '
            << hogpen::game_source_name(entry.source) << ' ' << (entry.delta >= 0 ? "+" : "") << entry.delta
            << " -> " << entry.balance_after << " at " << entry.created_at << '\n';
}

void print_stat(const hogpen::GameStat& stat) {
  std::cout << hogpen::game_source_name(stat.source) << ": played " << stat.played << ", won " << stat.wins
            << ", lost " << stat.losses << ", best streak " << stat.best_win_streak << ", highest payout "
            << stat.highest_payout << '\n';
  for (const auto& [key, value] : stat.counters) {
    std::cout << "  " << key << " = " << value << '\n';
  }
}

int run_command(hogpen::CoreApi& api, const std::vector<std::string>& args) {
  const std::string& command = args.front();

  if (command == "balance" && args.size() == 3) {
    std::int64_t balance = 0;
    const hogpen::Result result = api.balance({.user_id = args[1], .community_id = args[2]}, balance);
    if (!result.ok) {
      return report(result);
    }
    std::cout << args[1] << " has " << balance << ' ' << hogpen::kCurrencyName << '\n';
    return 0;
  }

  if (command == "history" && (args.size() == 3 || args.size() == 4)) {
    std::int64_t limit = 0;
    if (!parse_count(args, 3, 0, limit)) {
      print_usage();
      return 1;
    }
    const auto entries =
        api.balance_history({.user_id = args[1], .community_id = args[2]}, static_cast<std::size_t>(limit));
    for (const hogpen::LedgerEntry& entry : entries) {
      print_entry(entry);
    }
    std::cout << entries.size() << " entries\n";
    return 0;
  }

  if (command == "leaderboard" && (args.size() == 2 || args.size() == 3)) {
    std::int64_t limit = 10;
    if (!parse_count(args, 2, 10, limit)) {
      print_usage();
      return 1;
    }
    for (const hogpen::LeaderboardEntry& entry : api.leaderboard(args[1], static_cast<std::size_t>(limit))) {
      std::cout << entry.rank << ". " << entry.user_id << ' ' << entry.balance << '\n';
    }
    return 0;
  }

  if (command == "stats" && args.size() == 3) {
    const hogpen::PlayerRef player{.user_id = args[1], .community_id = args[2]};
    for (const hogpen::GameStat& stat : api.all_stats(player)) {
      print_stat(stat);
    }
    const hogpen::WrappedStats wrapped = api.wrapped_stats(player);
    std::cout << "games " << wrapped.total_games << ", wagered " << wrapped.total_wagered << ", winnings "
              << wrapped.total_winnings << ", net " << wrapped.net_profit << ", win rate " << wrapped.win_rate
              << "%\n";
    if (wrapped.favorite_game.has_value()) {
      std::cout << "favorite game " << hogpen::game_source_name(*wrapped.favorite_game) << " ("
                << wrapped.favorite_game_played << " games)\n";
    }
    std::cout << "biggest win " << wrapped.biggest_win << ", biggest loss " << wrapped.biggest_loss << '\n';
    return 0;
  }

  if (command == "recover" && args.size() == 1) {
    std::size_t recovered = 0;
    const hogpen::Result result = api.recover_all(recovered);
    if (!result.ok) {
      return report(result);
    }
    std::cout << "Recovered " << recovered << " stale games.\n";
    return 0;
  }

  if (command == "prune" && args.size() <= 2) {
    std::int64_t days = api.config().prune_keep_days;
    if (!parse_count(args, 1, days, days)) {
      print_usage();
      return 1;
    }
    std::size_t pruned = 0;
    return report(api.prune_old_games(days, pruned));
  }

  if (command == "verify" && args.size() == 1) {
    return report(api.verify_ledger());
  }

  if (command == "health" && args.size() == 1) {
    const hogpen::CasinoStatusReport status = api.status();
    const hogpen::StoreHealthReport& store = status.store;
    std::cout << hogpen::kAppDisplayName << ' ' << status.version << " (" << hogpen::kBuildRelease << ")\n"
              << "journal: " << status.journal_path << " (" << store.journal_bytes << " bytes, "
              << store.committed_batches << " batches)\n"
              << "accounts: " << store.account_count << ", ledger entries: " << store.ledger_entry_count
              << ", sessions: " << store.session_count << " (" << store.active_session_count << " active)"
              << ", crashes: " << store.crash_record_count << '\n'
              << "dropped records: " << store.dropped_records
              << (store.recovered_from_corruption ? " (recovered from a torn journal)" : "") << '\n'
              << (store.healthy ? "healthy" : "unhealthy") << ": " << store.details << '\n';
    return store.healthy ? 0 : 1;
  }

  print_usage();
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions options;
  if (!parse_options(argc, argv, options)) {
    print_usage();
    return 1;
  }

  hogpen::CoreApi api;
  const hogpen::Result init = api.init({
      .data_dir = options.data_dir,
      .config_path = options.config_path,
      .casino = std::nullopt,
      .clock = nullptr,
      .rng = nullptr,
      .recover_on_start = options.args.front() != "recover",
  });
  if (!init.ok) {
    std::cerr << "hogpen init failed: " << init.message << '\n';
    return 1;
  }

  const int status = run_command(api, options.args);
  api.wait_for_rank_updates();
  return status;
}

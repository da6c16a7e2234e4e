#include "core/service/casino_service.hpp"

#include <exception>
#include <utility>

#include "core/util/log.hpp"

namespace hogpen {
namespace {

std::string player_label(const PlayerRef& player) {
  return player.user_id + "@" + player.community_id;
}

Result unreadable_snapshot(GameSource source) {
  return Result::failure("Stored " + std::string{game_source_name(source)} + " state is unreadable.",
                         ErrorCode::CrashDetected);
}

Metadata outcome_metadata(const GameOutcome& outcome) {
  Metadata metadata{
      {"bet_amount", std::to_string(outcome.wager)},
      {"payout_amount", std::to_string(outcome.payout)},
      {"result", std::string{outcome_kind_name(outcome.kind)}},
  };
  if (!outcome.label.empty()) {
    metadata["detail"] = outcome.label;
  }
  if (outcome.flags.doubled) {
    metadata["double_down"] = "true";
  }
  return metadata;
}

}  // namespace

CasinoService::CasinoService(Store& store, WalletLedger& ledger, SessionCoordinator& sessions, StatsAggregator& stats,
                             const CasinoConfig& config, const util::Clock& clock, RandomSource& rng)
    : store_(store),
      ledger_(ledger),
      sessions_(sessions),
      stats_(stats),
      config_(config),
      clock_(clock),
      rng_(rng),
      card_duel_(config.dealer_stand_value),
      wheel_(config.wheel_max_bets) {}

Result CasinoService::validate_bet(GameSource source, std::int64_t bet) const {
  const BetLimits& limits = config_.limits_for(source);
  if (bet < limits.min_bet || bet > limits.max_bet) {
    return Result::failure(std::string{game_source_name(source)} + " bets must be between " +
                               std::to_string(limits.min_bet) + " and " + std::to_string(limits.max_bet) + ".",
                           ErrorCode::ValidationError);
  }
  return Result::success();
}

Result CasinoService::guarded(const PlayerRef& player, GameSource source, const Step& step) {
  std::string reason;
  try {
    const Result result = store_.run(step, config_.storage_retry_attempts);
    if (result.code != ErrorCode::CrashDetected) {
      return result;
    }
    reason = result.message;
  } catch (const std::exception& ex) {
    reason = std::string{"Game error: "} + ex.what();
  }

  util::log_error("casino", std::string{game_source_name(source)} + " action for " + player_label(player) +
                                " failed: " + reason);
  RecoveryReport report;
  const Result crashed = sessions_.force_crash(player, source, reason, report);
  if (!crashed.ok) {
    return crashed;
  }
  if (!report.crashed) {
    return Result::failure("Something went wrong with your game. Nothing was charged.", ErrorCode::CrashDetected);
  }
  return Result::failure("Something went wrong with your game. Your wager of " +
                             std::to_string(report.record.refund_amount) + " was refunded.",
                         ErrorCode::CrashDetected);
}

void CasinoService::fill_balance(Store::Transaction& txn, const PlayerRef& player, GameReport& report) const {
  if (const auto account = txn.account(player.user_id, player.community_id); account.has_value()) {
    report.balance = account->balance;
  }
}

Result CasinoService::place_wager(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                  std::int64_t amount, Metadata metadata) {
  metadata["bet_amount"] = std::to_string(amount);
  return ledger_.apply(txn, BalanceChange{
                                .user_id = player.user_id,
                                .community_id = player.community_id,
                                .delta = -amount,
                                .source = source,
                                .kind = UpdateKind::BetPlaced,
                                .metadata = std::move(metadata),
                            });
}

Result CasinoService::open_game(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                std::int64_t debit, std::string snapshot, GameReport& report) {
  RecoveryReport recovery;
  const Result recovered = sessions_.check_and_recover(txn, player, source, recovery);
  if (!recovered.ok) {
    return recovered;
  }
  report.recovered_stale = recovery.crashed;

  if (debit > 0) {
    const Result placed = place_wager(txn, player, source, debit, {});
    if (!placed.ok) {
      return placed;
    }
  } else {
    ledger_.ensure_account(txn, player.user_id, player.community_id);
  }

  GameSession session;
  const Result started = sessions_.start(txn, player, source, debit, snapshot, session);
  if (!started.ok) {
    return started;
  }
  report.session_id = session.session_id;
  report.outstanding = debit;
  report.snapshot = std::move(snapshot);
  return Result::success();
}

Result CasinoService::load_game(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                GameSession& session, GameReport& report) {
  const Result loaded = sessions_.load_active(txn, player, source, session);
  if (!loaded.ok) {
    return loaded;
  }
  report.session_id = session.session_id;
  report.outstanding = session.bet_amount;
  return Result::success();
}

Result CasinoService::credit_outcome(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                     const GameOutcome& outcome, Metadata metadata, GameReport& report) {
  for (auto& [key, value] : outcome_metadata(outcome)) {
    metadata.try_emplace(key, std::move(value));
  }
  const Result applied = ledger_.apply(txn, BalanceChange{
                                                .user_id = player.user_id,
                                                .community_id = player.community_id,
                                                .delta = outcome.payout,
                                                .source = source,
                                                .kind = outcome.ledger_kind(),
                                                .metadata = std::move(metadata),
                                            });
  if (!applied.ok) {
    return applied;
  }
  report.payout += outcome.payout;
  report.outcomes.push_back(outcome);
  return Result::success();
}

Result CasinoService::settle(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                             const GameOutcome& outcome, GameReport& report) {
  const Result credited = credit_outcome(txn, player, source, outcome, {}, report);
  if (!credited.ok) {
    return credited;
  }
  if (outcome.counts_as_game()) {
    return stats_.record(txn, player, source, outcome.won(), outcome.wager, outcome.payout, outcome.counters);
  }
  if (!outcome.counters.empty()) {
    return stats_.record_counters(txn, player, source, outcome.counters);
  }
  return Result::success();
}

Result CasinoService::close_game(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                 GameReport& report) {
  const Result finished = sessions_.finish(txn, player, source);
  if (!finished.ok) {
    return finished;
  }
  report.finished = true;
  report.outstanding = 0;
  fill_balance(txn, player, report);
  return Result::success();
}

Result CasinoService::keep_game(Store::Transaction& txn, const PlayerRef& player, GameSource source,
                                std::int64_t outstanding, std::string snapshot, GameReport& report) {
  const Result saved = sessions_.save_state(txn, player, source, outstanding, snapshot);
  if (!saved.ok) {
    return saved;
  }
  report.finished = false;
  report.outstanding = outstanding;
  report.snapshot = std::move(snapshot);
  fill_balance(txn, player, report);
  return Result::success();
}

// ---- card duel ----

Result CasinoService::start_card_duel(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  const Result valid = validate_bet(GameSource::CardDuel, bet);
  if (!valid.ok) {
    return valid;
  }

  GameReport report;
  const Result result = guarded(player, GameSource::CardDuel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::CardDuel};
    CardDuelState state;
    CardDuelStep step;
    const Result dealt = card_duel_.deal(bet, {}, rng_, state, step);
    if (!dealt.ok) {
      return dealt;
    }
    report.note = step.note;

    const Result opened =
        open_game(txn, player, GameSource::CardDuel, bet, CardDuelEngine::encode_state(state), report);
    if (!opened.ok) {
      return opened;
    }
    if (!step.finished) {
      fill_balance(txn, player, report);
      return Result::success(step.note);
    }

    for (const GameOutcome& outcome : step.outcomes) {
      const Result settled = settle(txn, player, GameSource::CardDuel, outcome, report);
      if (!settled.ok) {
        return settled;
      }
    }
    const Result closed = close_game(txn, player, GameSource::CardDuel, report);
    return closed.ok ? Result::success(step.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::card_duel_action(const PlayerRef& player, CardDuelAction action, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::CardDuel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::CardDuel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::CardDuel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    CardDuelState state;
    if (!CardDuelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::CardDuel);
    }

    CardDuelStep step;
    const Result acted = card_duel_.act(state, action, rng_, step);
    if (!acted.ok) {
      return acted;
    }
    report.note = step.note;

    if (step.extra_wager > 0) {
      const Result placed = place_wager(txn, player, GameSource::CardDuel, step.extra_wager,
                                        {{"action", std::string{card_duel_action_name(action)}}});
      if (!placed.ok) {
        return placed;
      }
    }

    if (!step.finished) {
      const Result kept = keep_game(txn, player, GameSource::CardDuel, state.total_wagered(),
                                    CardDuelEngine::encode_state(state), report);
      return kept.ok ? Result::success(step.note) : kept;
    }

    report.snapshot = CardDuelEngine::encode_state(state);
    for (const GameOutcome& outcome : step.outcomes) {
      const Result settled = settle(txn, player, GameSource::CardDuel, outcome, report);
      if (!settled.ok) {
        return settled;
      }
    }
    const Result closed = close_game(txn, player, GameSource::CardDuel, report);
    return closed.ok ? Result::success(step.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

// ---- reel ----

Result CasinoService::start_reel(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  const Result valid = validate_bet(GameSource::Reel, bet);
  if (!valid.ok) {
    return valid;
  }

  GameReport report;
  const Result result = guarded(player, GameSource::Reel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Reel};
    const ReelState state{.bet = bet, .spins_taken = 0, .bonus_available = false};
    const Result opened = open_game(txn, player, GameSource::Reel, bet, ReelEngine::encode_state(state), report);
    if (!opened.ok) {
      return opened;
    }

    const std::int64_t contribution = ReelEngine::jackpot_contribution(bet, config_.jackpot_contribution_percent);
    const JackpotPool pool = txn.jackpot_add(player.community_id, contribution, config_.jackpot_seed);
    report.jackpot_amount = pool.amount;
    report.note = "Jackpot is now " + std::to_string(pool.amount) + ".";
    fill_balance(txn, player, report);
    return Result::success(report.note);
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::crank_reel(const PlayerRef& player, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Reel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Reel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Reel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    ReelState state;
    if (!ReelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Reel);
    }
    if (state.spins_taken > 0 && !state.bonus_available) {
      return unreadable_snapshot(GameSource::Reel);
    }

    const bool bonus_round = state.spins_taken > 0;
    const ReelLine line = reel_.spin(rng_);
    const JackpotPool pool = txn.jackpot(player.community_id, config_.jackpot_seed);
    const GameOutcome outcome = reel_.settle(line, state.bet, pool.amount, bonus_round);
    report.reel_line = line;
    report.note = reel_.evaluate(line).text;

    if (outcome.flags.jackpot_hit) {
      const JackpotPool reset =
          txn.jackpot_reset(player.community_id, config_.jackpot_seed, player.user_id, clock_.now());
      report.jackpot_amount = reset.amount;
      util::log_info("casino", "Jackpot of " + std::to_string(pool.amount) + " won by " + player_label(player));
    } else {
      report.jackpot_amount = pool.amount;
    }

    const Result credited = credit_outcome(txn, player, GameSource::Reel, outcome,
                                           {
                                               {"bonus_spin", bonus_round ? "true" : "false"},
                                               {"jackpot_hit", outcome.flags.jackpot_hit ? "true" : "false"},
                                           },
                                           report);
    if (!credited.ok) {
      return credited;
    }
    const Result recorded = stats_.record(txn, player, GameSource::Reel, outcome.won(), outcome.wager,
                                          outcome.payout, outcome.counters);
    if (!recorded.ok) {
      return recorded;
    }

    ++state.spins_taken;
    if (outcome.flags.bonus_spin && !bonus_round) {
      state.bonus_available = true;
      const Result kept = keep_game(txn, player, GameSource::Reel, 0, ReelEngine::encode_state(state), report);
      return kept.ok ? Result::success(report.note) : kept;
    }

    state.bonus_available = false;
    report.snapshot = ReelEngine::encode_state(state);
    const Result closed = close_game(txn, player, GameSource::Reel, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

// ---- wheel ----

Result CasinoService::start_wheel(const PlayerRef& player, std::int64_t base_bet, GameReport& out) {
  const Result valid = validate_bet(GameSource::Wheel, base_bet);
  if (!valid.ok) {
    return valid;
  }

  GameReport report;
  const Result result = guarded(player, GameSource::Wheel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Wheel};
    const WheelState state{.base_bet = base_bet, .bets = {}};
    const Result opened = open_game(txn, player, GameSource::Wheel, 0, WheelEngine::encode_state(state), report);
    if (!opened.ok) {
      return opened;
    }
    fill_balance(txn, player, report);
    report.note = "Place your bets.";
    return Result::success(report.note);
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::place_wheel_bet(const PlayerRef& player, WheelBetType type, int pocket, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Wheel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Wheel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Wheel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    WheelState state;
    if (!WheelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Wheel);
    }

    const Result placed_bet = wheel_.place_bet(state, type, pocket);
    if (!placed_bet.ok) {
      return placed_bet;
    }
    Metadata metadata{{"bet_type", std::string{wheel_bet_type_name(type)}}};
    if (type == WheelBetType::Straight) {
      metadata["number"] = format_pocket(pocket);
    }
    const Result debited = place_wager(txn, player, GameSource::Wheel, state.base_bet, std::move(metadata));
    if (!debited.ok) {
      return debited;
    }

    report.note = placed_bet.message;
    const Result kept =
        keep_game(txn, player, GameSource::Wheel, state.total_wagered(), WheelEngine::encode_state(state), report);
    return kept.ok ? Result::success(report.note) : kept;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::clear_wheel_bets(const PlayerRef& player, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Wheel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Wheel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Wheel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    WheelState state;
    if (!WheelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Wheel);
    }

    for (const WheelBet& bet : state.bets) {
      const Result refunded = ledger_.apply(txn, BalanceChange{
                                                     .user_id = player.user_id,
                                                     .community_id = player.community_id,
                                                     .delta = bet.amount,
                                                     .source = GameSource::Wheel,
                                                     .kind = UpdateKind::Refund,
                                                     .metadata =
                                                         {
                                                             {"bet_type", std::string{wheel_bet_type_name(bet.type)}},
                                                             {"bet_amount", std::to_string(bet.amount)},
                                                             {"reason", "cleared"},
                                                         },
                                                 });
      if (!refunded.ok) {
        return refunded;
      }
      report.payout += bet.amount;
    }
    state.bets.clear();

    report.note = "Bets cleared.";
    const Result kept = keep_game(txn, player, GameSource::Wheel, 0, WheelEngine::encode_state(state), report);
    return kept.ok ? Result::success(report.note) : kept;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::cancel_wheel(const PlayerRef& player, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Wheel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Wheel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Wheel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    WheelState state;
    if (!WheelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Wheel);
    }

    for (const WheelBet& bet : state.bets) {
      const Result refunded = ledger_.apply(txn, BalanceChange{
                                                     .user_id = player.user_id,
                                                     .community_id = player.community_id,
                                                     .delta = bet.amount,
                                                     .source = GameSource::Wheel,
                                                     .kind = UpdateKind::Refund,
                                                     .metadata =
                                                         {
                                                             {"bet_type", std::string{wheel_bet_type_name(bet.type)}},
                                                             {"bet_amount", std::to_string(bet.amount)},
                                                             {"reason", "cancelled"},
                                                         },
                                                 });
      if (!refunded.ok) {
        return refunded;
      }
      report.payout += bet.amount;
    }

    report.note = "Table closed, bets returned.";
    const Result closed = close_game(txn, player, GameSource::Wheel, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::spin_wheel(const PlayerRef& player, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Wheel, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Wheel};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Wheel, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    WheelState state;
    if (!WheelEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Wheel);
    }
    if (state.bets.empty()) {
      return Result::failure("Place at least one bet before spinning.", ErrorCode::ValidationError);
    }

    const WheelSpin spin = wheel_.spin(state, rng_);
    report.pocket = spin.pocket;
    report.snapshot = WheelEngine::encode_state(state);
    const std::string winning = format_pocket(spin.pocket);

    for (std::size_t idx = 0; idx < spin.outcomes.size(); ++idx) {
      const WheelBet& bet = state.bets[idx];
      Metadata metadata{
          {"bet_type", std::string{wheel_bet_type_name(bet.type)}},
          {"winning_number", winning},
      };
      if (spin.outcomes[idx].won()) {
        metadata["multiplier"] = std::to_string(bet.payout_ratio);
      }
      const Result credited =
          credit_outcome(txn, player, GameSource::Wheel, spin.outcomes[idx], std::move(metadata), report);
      if (!credited.ok) {
        return credited;
      }
    }

    const Result recorded = stats_.record(txn, player, GameSource::Wheel, spin.any_won(), state.total_wagered(),
                                          spin.total_payout, spin.counters);
    if (!recorded.ok) {
      return recorded;
    }

    report.note = "The ball lands on " + winning + " " + std::string{pocket_color_name(pocket_color(spin.pocket))} +
                  ".";
    const Result closed = close_game(txn, player, GameSource::Wheel, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

// ---- ladder ----

Result CasinoService::start_ladder(const PlayerRef& player, std::int64_t bet, GameReport& out) {
  const Result valid = validate_bet(GameSource::Ladder, bet);
  if (!valid.ok) {
    return valid;
  }

  GameReport report;
  const Result result = guarded(player, GameSource::Ladder, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Ladder};
    LadderState state;
    const Result dealt = ladder_.deal(bet, {}, rng_, state);
    if (!dealt.ok) {
      return dealt;
    }
    const Result opened =
        open_game(txn, player, GameSource::Ladder, bet, LadderEngine::encode_state(state), report);
    if (!opened.ok) {
      return opened;
    }
    report.note = dealt.message;
    fill_balance(txn, player, report);
    return Result::success(report.note);
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::ladder_guess(const PlayerRef& player, LadderChoice choice, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Ladder, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Ladder};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Ladder, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    LadderState state;
    if (!LadderEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Ladder);
    }

    const int round = state.stage;
    LadderStep step;
    const Result guessed = ladder_.guess(state, choice, rng_, step);
    if (!guessed.ok) {
      return guessed;
    }
    report.note = step.note;

    if (step.round_won) {
      const Result logged = ledger_.apply(txn, BalanceChange{
                                                   .user_id = player.user_id,
                                                   .community_id = player.community_id,
                                                   .delta = 0,
                                                   .source = GameSource::Ladder,
                                                   .kind = UpdateKind::RoundWon,
                                                   .metadata =
                                                       {
                                                           {"bet_amount", std::to_string(state.bet)},
                                                           {"round", std::to_string(round)},
                                                           {"choice", std::string{ladder_choice_name(choice)}},
                                                           {"actual", step.actual},
                                                       },
                                               });
      if (!logged.ok) {
        return logged;
      }
      const Result counted = stats_.record_counters(txn, player, GameSource::Ladder, step.counters);
      if (!counted.ok) {
        return counted;
      }
      const Result kept =
          keep_game(txn, player, GameSource::Ladder, state.bet, LadderEngine::encode_state(state), report);
      return kept.ok ? Result::success(report.note) : kept;
    }

    if (!step.outcome.has_value()) {
      return Result::failure("Ladder round ended without an outcome.", ErrorCode::CrashDetected);
    }
    report.snapshot = LadderEngine::encode_state(state);
    const Result settled = settle(txn, player, GameSource::Ladder, *step.outcome, report);
    if (!settled.ok) {
      return settled;
    }
    const Result closed = close_game(txn, player, GameSource::Ladder, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

Result CasinoService::ladder_cash_out(const PlayerRef& player, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, GameSource::Ladder, [&](Store::Transaction& txn) {
    report = GameReport{.source = GameSource::Ladder};
    GameSession session;
    const Result loaded = load_game(txn, player, GameSource::Ladder, session, report);
    if (!loaded.ok) {
      return loaded;
    }
    LadderState state;
    if (!LadderEngine::decode_state(session.state_snapshot, state)) {
      return unreadable_snapshot(GameSource::Ladder);
    }

    LadderStep step;
    const Result cashed = ladder_.cash_out(state, step);
    if (!cashed.ok) {
      return cashed;
    }
    report.note = step.note;
    report.snapshot = LadderEngine::encode_state(state);
    const Result settled = settle(txn, player, GameSource::Ladder, *step.outcome, report);
    if (!settled.ok) {
      return settled;
    }
    const Result closed = close_game(txn, player, GameSource::Ladder, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    out = std::move(report);
  }
  return result;
}

// ---- expiry and economy ----

Result CasinoService::expire_game(const PlayerRef& player, GameSource source, GameReport& out) {
  GameReport report;
  const Result result = guarded(player, source, [&](Store::Transaction& txn) {
    report = GameReport{.source = source};
    GameSession session;
    const Result loaded = load_game(txn, player, source, session, report);
    if (!loaded.ok) {
      return loaded;
    }

    WheelState wheel_state;
    if (source == GameSource::Wheel) {
      if (!WheelEngine::decode_state(session.state_snapshot, wheel_state)) {
        return unreadable_snapshot(GameSource::Wheel);
      }
      for (const WheelBet& bet : wheel_state.bets) {
        const Result refunded = ledger_.apply(
            txn, BalanceChange{
                     .user_id = player.user_id,
                     .community_id = player.community_id,
                     .delta = bet.amount,
                     .source = source,
                     .kind = UpdateKind::Refund,
                     .metadata =
                         {
                             {"bet_type", std::string{wheel_bet_type_name(bet.type)}},
                             {"bet_amount", std::to_string(bet.amount)},
                             {"reason", "timeout"},
                         },
                 });
        if (!refunded.ok) {
          return refunded;
        }
        report.payout += bet.amount;
      }
      report.note = "Table timed out, bets returned.";
    } else if (session.bet_amount > 0) {
      GameOutcome forfeited;
      forfeited.kind = OutcomeKind::Loss;
      forfeited.wager = session.bet_amount;
      forfeited.label = "timeout";
      const Result settled = settle(txn, player, source, forfeited, report);
      if (!settled.ok) {
        return settled;
      }
      report.note = "Game timed out. The wager of " + std::to_string(session.bet_amount) + " is lost.";
    } else {
      report.note = "Game timed out.";
    }

    report.snapshot = session.state_snapshot;
    const Result closed = close_game(txn, player, source, report);
    return closed.ok ? Result::success(report.note) : closed;
  });

  if (result.ok) {
    util::log_info("casino", std::string{game_source_name(source)} + " game of " + player_label(player) +
                                 " expired.");
    out = std::move(report);
  }
  return result;
}

Result CasinoService::beg(const PlayerRef& player, std::int64_t& amount, std::int64_t& new_balance) {
  std::int64_t granted = 0;
  std::int64_t balance_after = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        const Account account = ledger_.ensure_account(txn, player.user_id, player.community_id);
        const std::int64_t threshold = config_.smallest_min_bet();
        if (account.balance >= threshold) {
          return Result::failure("You still have " + std::to_string(account.balance) +
                                     " coins. Begging is for balances under " + std::to_string(threshold) + ".",
                                 ErrorCode::ValidationError);
        }

        granted = uniform_between(config_.beg_min, config_.beg_max, rng_);
        LedgerEntry entry;
        const Result credited = ledger_.apply(txn,
                                              BalanceChange{
                                                  .user_id = player.user_id,
                                                  .community_id = player.community_id,
                                                  .delta = granted,
                                                  .source = GameSource::Beg,
                                                  .kind = UpdateKind::BegReceived,
                                                  .metadata = {{"beg_count", std::to_string(account.beg_count + 1)}},
                                              },
                                              &entry);
        if (!credited.ok) {
          return credited;
        }
        balance_after = entry.balance_after;
        return ledger_.increment_beg_count(txn, player.user_id, player.community_id);
      },
      config_.storage_retry_attempts);

  if (result.ok) {
    amount = granted;
    new_balance = balance_after;
    util::log_info("casino", player_label(player) + " begged and received " + std::to_string(granted));
    return Result::success("You received " + std::to_string(granted) + " coins.", std::to_string(granted));
  }
  return result;
}

Result CasinoService::loan(std::string_view lender_id, std::string_view receiver_id, std::string_view community_id,
                           std::int64_t amount, std::int64_t& lender_balance, std::int64_t& receiver_balance) {
  std::int64_t lender_after = 0;
  std::int64_t receiver_after = 0;
  const Result result = store_.run(
      [&](Store::Transaction& txn) {
        const std::int64_t now = clock_.now();
        const std::size_t recent = txn.loans_since(lender_id, community_id, now - config_.loan_window_seconds);
        if (static_cast<std::int64_t>(recent) >= config_.loan_rate_limit) {
          return Result::failure("Loan limit reached: " + std::to_string(config_.loan_rate_limit) + " loans per " +
                                     std::to_string(config_.loan_window_seconds / 60) + " minutes.",
                                 ErrorCode::RateLimited);
        }

        const Result moved = ledger_.transfer(txn, lender_id, receiver_id, community_id, amount, lender_after,
                                              receiver_after);
        if (!moved.ok) {
          return moved;
        }
        txn.add_loan(LoanRecord{
            .lender_id = std::string{lender_id},
            .community_id = std::string{community_id},
            .created_at = now,
        });
        return moved;
      },
      config_.storage_retry_attempts);

  if (result.ok) {
    lender_balance = lender_after;
    receiver_balance = receiver_after;
    util::log_info("casino", std::string{lender_id} + " lent " + std::to_string(amount) + " to " +
                                 std::string{receiver_id} + " in " + std::string{community_id});
  }
  return result;
}

std::int64_t CasinoService::jackpot_amount(std::string_view community_id) const {
  const auto pool = store_.jackpot(community_id);
  return pool.has_value() ? pool->amount : config_.jackpot_seed;
}

}  // namespace hogpen

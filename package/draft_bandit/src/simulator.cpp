#include "draft_bandit/simulator.hpp"
#include "draft_bandit/errors.hpp"
#include "draft_bandit/market.hpp"

#include <fmt/format.h>

namespace draft_bandit {

namespace {

std::size_t checked_round_count(const Ucb1Selector &bandit,
                                const PlayerPool &pool, const SimConfig &cfg) {
  if (pool.empty())
    throw ConfigurationError("Simulation needs a non-empty player pool");
  if (cfg.rounds && *cfg.rounds < 0) {
    throw ConfigurationError(
        fmt::format("Round count must be non-negative, got {}", *cfg.rounds));
  }
  const std::size_t n_rounds =
      cfg.rounds ? static_cast<std::size_t>(*cfg.rounds) : pool.size();
  if (n_rounds > pool.size()) {
    throw IndexOutOfRange(fmt::format(
        "Simulation asks for {} rounds but the pool holds {} players",
        n_rounds, pool.size()));
  }
  for (std::size_t a = 0; a < bandit.num_arms(); ++a) {
    if (&bandit.strategy(a).pool() != &pool) {
      throw ConfigurationError(fmt::format(
          "Strategy {} ({}) is bound to a different player pool", a,
          bandit.strategy(a).name()));
    }
  }
  return n_rounds;
}

} // namespace

SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool,
                          const SimConfig &cfg) {
  const std::size_t n_rounds = checked_round_count(bandit, pool, cfg);
  CompetitiveMarket market(cfg.competitive_low, cfg.competitive_high, cfg.seed);

  const auto n = static_cast<Eigen::Index>(pool.size());
  SimSummary summary;
  summary.final_owner = Eigen::ArrayXi::Constant(n, -1);
  summary.winning_bid = Eigen::VectorXd::Zero(n);
  summary.rounds.reserve(n_rounds);

  for (std::size_t i = 0; i < n_rounds; ++i) {
    const double competitive_bid = market.next_bid(pool.at(i));
    const RoundRecord rec =
        run_round(i, competitive_bid, bandit, cfg.budget_policy);
    if (rec.reward == 1) {
      summary.final_owner[static_cast<Eigen::Index>(i)] =
          static_cast<int>(rec.arm);
      summary.winning_bid[static_cast<Eigen::Index>(i)] = rec.bid;
    }
    if (cfg.verbose) {
      const Player &p = pool.at(i);
      fmt::print("[Debug] round={} role={} value={} arm={} ({}) bid={:.2f} "
                 "competitive={:.2f} reward={} budget={:.2f}\n",
                 i, role_name(p.role), p.value, rec.arm,
                 bandit.strategy(rec.arm).name(), rec.bid, rec.competitive_bid,
                 rec.reward, bandit.strategy(rec.arm).roster().remaining_budget());
    }
    summary.rounds.push_back(rec);
  }

  summary.arms = bandit.arms();
  summary.strategies.reserve(bandit.num_arms());
  for (std::size_t a = 0; a < bandit.num_arms(); ++a) {
    const BiddingStrategy &s = bandit.strategy(a);
    StrategyOutcome out;
    out.name = s.name();
    out.acquired_players = s.roster().acquired();
    out.remaining_budget = s.roster().remaining_budget();
    summary.strategies.push_back(out);
    if (cfg.verbose) {
      fmt::print("[Debug] arm={} ({}) pulls={} mean_reward={:.4f} acquired={} "
                 "remaining_budget={:.2f}\n",
                 a, out.name, summary.arms[a].count,
                 summary.arms[a].mean_reward, out.acquired_players.size(),
                 out.remaining_budget);
    }
  }
  return summary;
}

SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool) {
  return run_simulation(bandit, pool, SimConfig{});
}

SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool,
                          int rounds) {
  SimConfig cfg;
  cfg.rounds = rounds;
  return run_simulation(bandit, pool, cfg);
}

} // namespace draft_bandit

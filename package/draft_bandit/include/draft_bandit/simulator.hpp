#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "draft_bandit/auction.hpp"
#include "draft_bandit/bandit.hpp"
#include "draft_bandit/player.hpp"
#include "draft_bandit/roster.hpp"

namespace draft_bandit {

struct SimConfig {
  std::optional<int> rounds; // unset: one round per player in the pool
  std::uint64_t seed{0};
  double competitive_low{0.7};
  double competitive_high{1.2};
  BudgetPolicy budget_policy{BudgetPolicy::kUnchecked};
  bool verbose{false};
};

struct StrategyOutcome {
  std::string name;
  std::vector<std::size_t> acquired_players;
  double remaining_budget{0.0};
};

struct SimSummary {
  std::vector<StrategyOutcome> strategies; // aligned with bandit arms
  std::vector<ArmState> arms;
  std::vector<RoundRecord> rounds;
  Eigen::ArrayXi final_owner;   // per-player winning arm, -1 if unsold
  Eigen::VectorXd winning_bid;  // per-player winning bid, 0 if unsold
};

// Auctions players 0..rounds-1 of the pool in order, one round each. Every
// strategy registered with the bandit must have been built on this pool.
// Before any round runs: ConfigurationError for an empty pool or negative
// rounds, IndexOutOfRange if rounds exceeds the pool.
SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool,
                          const SimConfig &cfg);

// One round per player in the pool.
SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool);
SimSummary run_simulation(Ucb1Selector &bandit, const PlayerPool &pool,
                          int rounds);

} // namespace draft_bandit

#pragma once

#include <cstddef>

#include "draft_bandit/bandit.hpp"
#include "draft_bandit/roster.hpp"

namespace draft_bandit {

struct RoundRecord {
  std::size_t player_idx{0};
  std::size_t arm{0};
  double bid{0.0};
  double competitive_bid{0.0};
  int reward{0}; // 1 = won
};

// Single sealed-bid round against a synthetic market bid: the bandit picks
// a strategy, the strategy bids, a strictly higher bid wins. The outcome is
// fed back to the bandit and the strategy, and a win is added to the
// strategy's roster.
RoundRecord run_round(std::size_t player_idx, double competitive_bid,
                      Ucb1Selector &bandit,
                      BudgetPolicy policy = BudgetPolicy::kUnchecked);

} // namespace draft_bandit

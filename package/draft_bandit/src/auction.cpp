#include "draft_bandit/auction.hpp"

namespace draft_bandit {

RoundRecord run_round(std::size_t player_idx, double competitive_bid,
                      Ucb1Selector &bandit, BudgetPolicy policy) {
  RoundRecord rec;
  rec.player_idx = player_idx;
  rec.competitive_bid = competitive_bid;
  rec.arm = bandit.select_arm();

  BiddingStrategy &strategy = bandit.strategy(rec.arm);
  const bool open_slot = strategy.can_acquire(player_idx);
  rec.bid = strategy.compute_bid(player_idx);

  // Ties go to the market
  rec.reward = (rec.bid > competitive_bid) ? 1 : 0;
  bandit.update(rec.arm, static_cast<double>(rec.reward));

  if (open_slot)
    strategy.observe_bid(rec.bid, rec.reward == 1);
  if (rec.reward == 1)
    strategy.acquire(player_idx, policy);
  return rec;
}

} // namespace draft_bandit

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include <Eigen/Dense>

#include "draft_bandit/strategy.hpp"

namespace draft_bandit {

struct ArmState {
  int count{0};
  double mean_reward{0.0};
};

// UCB1 over a set of bidding strategies, one arm per strategy.
//
// Every arm is played once, lowest index first, before any score is used.
// After that the arm maximizing
//
//   mean_reward + sqrt(exploration * ln(total_count) / count)
//
// is chosen, ties going to the lowest index. exploration = 2 is classic UCB1.
class Ucb1Selector {
public:
  explicit Ucb1Selector(std::vector<std::shared_ptr<BiddingStrategy>> strategies,
                        double exploration = 2.0);

  std::size_t num_arms() const { return strategies_.size(); }

  std::size_t select_arm() const;

  // reward must lie in [0, 1].
  void update(std::size_t arm, double reward);

  // Confidence-adjusted score per arm; +inf for arms never played.
  Eigen::ArrayXd ucb_scores() const;

  ArmState arm(std::size_t idx) const;
  std::vector<ArmState> arms() const;
  const Eigen::ArrayXi &counts() const { return counts_; }
  const Eigen::ArrayXd &mean_rewards() const { return means_; }
  long total_count() const { return total_count_; }
  double exploration() const { return exploration_; }

  BiddingStrategy &strategy(std::size_t arm);
  const BiddingStrategy &strategy(std::size_t arm) const;
  const std::vector<std::shared_ptr<BiddingStrategy>> &strategies() const {
    return strategies_;
  }

  // Clears arm statistics only; strategies keep their state.
  void reset();

private:
  void check_arm(std::size_t arm) const;

  std::vector<std::shared_ptr<BiddingStrategy>> strategies_;
  double exploration_{2.0};
  Eigen::ArrayXi counts_;
  Eigen::ArrayXd means_;
  long total_count_{0};
};

} // namespace draft_bandit

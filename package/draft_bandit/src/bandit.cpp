#include "draft_bandit/bandit.hpp"
#include "draft_bandit/errors.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace draft_bandit {

Ucb1Selector::Ucb1Selector(
    std::vector<std::shared_ptr<BiddingStrategy>> strategies,
    double exploration)
    : strategies_(std::move(strategies)), exploration_(exploration) {
  if (strategies_.empty())
    throw ConfigurationError("Ucb1Selector: at least one strategy is required");
  for (std::size_t i = 0; i < strategies_.size(); ++i) {
    if (!strategies_[i])
      throw ConfigurationError(fmt::format("Ucb1Selector: strategy {} is null", i));
  }
  if (!(exploration_ >= 0.0)) {
    throw ConfigurationError(fmt::format(
        "Ucb1Selector: exploration must be non-negative, got {}", exploration_));
  }
  const auto n = static_cast<Eigen::Index>(strategies_.size());
  counts_ = Eigen::ArrayXi::Zero(n);
  means_ = Eigen::ArrayXd::Zero(n);
}

void Ucb1Selector::check_arm(std::size_t arm) const {
  if (arm >= strategies_.size()) {
    throw IndexOutOfRange(fmt::format("Arm {} out of range for {} arms", arm,
                                      strategies_.size()));
  }
}

std::size_t Ucb1Selector::select_arm() const {
  // Forced exploration, one pull per arm in index order
  for (Eigen::Index i = 0; i < counts_.size(); ++i) {
    if (counts_[i] == 0)
      return static_cast<std::size_t>(i);
  }
  const Eigen::ArrayXd scores = ucb_scores();
  Eigen::Index best = 0;
  for (Eigen::Index i = 1; i < scores.size(); ++i) {
    if (scores[i] > scores[best])
      best = i;
  }
  return static_cast<std::size_t>(best);
}

void Ucb1Selector::update(std::size_t arm, double reward) {
  check_arm(arm);
  if (!(reward >= 0.0 && reward <= 1.0)) {
    throw std::invalid_argument(
        fmt::format("Reward must be in [0, 1], got {}", reward));
  }
  const auto i = static_cast<Eigen::Index>(arm);
  counts_[i] += 1;
  ++total_count_;
  means_[i] += (reward - means_[i]) / static_cast<double>(counts_[i]);
}

Eigen::ArrayXd Ucb1Selector::ucb_scores() const {
  Eigen::ArrayXd scores(counts_.size());
  const double log_total =
      total_count_ > 0 ? std::log(static_cast<double>(total_count_)) : 0.0;
  for (Eigen::Index i = 0; i < counts_.size(); ++i) {
    if (counts_[i] == 0) {
      scores[i] = std::numeric_limits<double>::infinity();
      continue;
    }
    scores[i] = means_[i] + std::sqrt(exploration_ * log_total /
                                      static_cast<double>(counts_[i]));
  }
  return scores;
}

ArmState Ucb1Selector::arm(std::size_t idx) const {
  check_arm(idx);
  const auto i = static_cast<Eigen::Index>(idx);
  ArmState st;
  st.count = counts_[i];
  st.mean_reward = means_[i];
  return st;
}

std::vector<ArmState> Ucb1Selector::arms() const {
  std::vector<ArmState> out;
  out.reserve(strategies_.size());
  for (std::size_t a = 0; a < strategies_.size(); ++a)
    out.push_back(arm(a));
  return out;
}

BiddingStrategy &Ucb1Selector::strategy(std::size_t arm) {
  check_arm(arm);
  return *strategies_[arm];
}

const BiddingStrategy &Ucb1Selector::strategy(std::size_t arm) const {
  check_arm(arm);
  return *strategies_[arm];
}

void Ucb1Selector::reset() {
  counts_.setZero();
  means_.setZero();
  total_count_ = 0;
}

} // namespace draft_bandit

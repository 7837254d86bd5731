#include "draft_bandit/strategy.hpp"
#include "draft_bandit/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace draft_bandit {

BiddingStrategy::BiddingStrategy(const PlayerPool &pool, double initial_budget,
                                 RoleRequirements requirements)
    : pool_(&pool), roster_(initial_budget, std::move(requirements)) {}

bool BiddingStrategy::can_acquire(std::size_t player_idx) const {
  return roster_.can_add(pool_->at(player_idx).role);
}

double BiddingStrategy::compute_bid(std::size_t player_idx) {
  const Player &p = pool_->at(player_idx);
  // A full role is a hard gate
  if (!roster_.can_add(p.role))
    return 0.0;
  return std::max(0.0, bid_for(p));
}

void BiddingStrategy::acquire(std::size_t player_idx, BudgetPolicy policy) {
  roster_.add(player_idx, pool_->at(player_idx), policy);
}

EpsilonGreedy::EpsilonGreedy(const PlayerPool &pool, double initial_budget,
                             double epsilon, double exploitation_factor,
                             std::uint64_t seed, RoleRequirements requirements)
    : BiddingStrategy(pool, initial_budget, std::move(requirements)),
      epsilon_(epsilon), exploitation_factor_(exploitation_factor),
      seed_(seed), rng_(seed) {
  if (!(epsilon_ >= 0.0 && epsilon_ <= 1.0)) {
    throw ConfigurationError(
        fmt::format("EpsilonGreedy: epsilon must be in [0, 1], got {}",
                    epsilon_));
  }
  if (!(exploitation_factor_ >= 0.0)) {
    throw ConfigurationError(fmt::format(
        "EpsilonGreedy: exploitation_factor must be non-negative, got {}",
        exploitation_factor_));
  }
}

double EpsilonGreedy::bid_for(const Player &p) {
  std::uniform_real_distribution<double> unif(0.0, 1.0);
  if (unif(rng_) < epsilon_) {
    std::uniform_real_distribution<double> explore(0.0, p.value);
    return explore(rng_);
  }
  return p.value * exploitation_factor_;
}

void EpsilonGreedy::reset() {
  BiddingStrategy::reset();
  rng_.seed(seed_);
}

Reactive::Reactive(const PlayerPool &pool, double initial_budget,
                   double initial_bid_factor, RoleRequirements requirements)
    : BiddingStrategy(pool, initial_budget, std::move(requirements)),
      initial_bid_factor_(initial_bid_factor) {
  if (!(initial_bid_factor_ >= 0.0)) {
    throw ConfigurationError(fmt::format(
        "Reactive: initial_bid_factor must be non-negative, got {}",
        initial_bid_factor_));
  }
}

double Reactive::average_bid() const {
  if (bid_history_.empty())
    return 0.0;
  return history_sum_ / static_cast<double>(bid_history_.size());
}

double Reactive::bid_for(const Player &p) {
  const double v = p.value;
  if (bid_history_.empty())
    return v * initial_bid_factor_;
  const double bid_factor = average_bid() / v + 0.05;
  return v * bid_factor;
}

void Reactive::observe_bid(double bid, bool /*won*/) {
  // Wins and losses alike: the history is what this strategy offered
  bid_history_.push_back(bid);
  history_sum_ += bid;
}

void Reactive::reset() {
  BiddingStrategy::reset();
  bid_history_.clear();
  history_sum_ = 0.0;
}

ValueBased::ValueBased(const PlayerPool &pool, double initial_budget,
                       RoleRequirements requirements)
    : BiddingStrategy(pool, initial_budget, std::move(requirements)) {}

OptimalTeamCompositionLP::OptimalTeamCompositionLP(
    const PlayerPool &pool, double initial_budget,
    RoleRequirements requirements)
    : BiddingStrategy(pool, initial_budget, std::move(requirements)) {}

} // namespace draft_bandit

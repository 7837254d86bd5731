#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "draft_bandit/player.hpp"
#include "draft_bandit/roster.hpp"

namespace draft_bandit {

// A bidder over a fixed player pool. Each strategy owns its roster; the
// roster's role caps gate every bid: a strategy with no open slot for a
// player's role bids 0 on that player.
//
// All variants are built as (pool, initial_budget, variant params...,
// requirements). The pool is not owned and must outlive the strategy.
class BiddingStrategy {
public:
  virtual ~BiddingStrategy() = default;

  virtual std::string name() const = 0;

  bool can_acquire(std::size_t player_idx) const;

  // 0 when can_acquire is false, otherwise the variant's bid (>= 0).
  double compute_bid(std::size_t player_idx);

  // Called once per round the strategy took part in with an open slot,
  // after the winner is known.
  virtual void observe_bid(double bid, bool won) {
    (void)bid;
    (void)won;
  }

  void acquire(std::size_t player_idx,
               BudgetPolicy policy = BudgetPolicy::kUnchecked);

  // Back to the freshly constructed state.
  virtual void reset() { roster_.reset(); }

  const Roster &roster() const { return roster_; }
  Roster &mutable_roster() { return roster_; }
  const PlayerPool &pool() const { return *pool_; }

protected:
  BiddingStrategy(const PlayerPool &pool, double initial_budget,
                  RoleRequirements requirements);

  virtual double bid_for(const Player &p) = 0;

private:
  const PlayerPool *pool_{nullptr};
  Roster roster_;
};

// Exploits at value * exploitation_factor; with probability epsilon bids a
// uniform draw on [0, value) instead.
class EpsilonGreedy : public BiddingStrategy {
public:
  EpsilonGreedy(const PlayerPool &pool, double initial_budget,
                double epsilon = 0.1, double exploitation_factor = 0.8,
                std::uint64_t seed = 0,
                RoleRequirements requirements = RoleRequirements());

  std::string name() const override { return "EpsilonGreedy"; }
  void reset() override;

  double epsilon() const { return epsilon_; }
  double exploitation_factor() const { return exploitation_factor_; }
  std::uint64_t seed() const { return seed_; }

protected:
  double bid_for(const Player &p) override;

private:
  double epsilon_{0.1};
  double exploitation_factor_{0.8};
  std::uint64_t seed_{0};
  std::mt19937_64 rng_;
};

// Bids value * initial_bid_factor until it has a history, then tracks the
// mean of its past submitted bids plus 5% of the player's value.
class Reactive : public BiddingStrategy {
public:
  Reactive(const PlayerPool &pool, double initial_budget,
           double initial_bid_factor = 1.0,
           RoleRequirements requirements = RoleRequirements());

  std::string name() const override { return "Reactive"; }
  void observe_bid(double bid, bool won) override;
  void reset() override;

  double initial_bid_factor() const { return initial_bid_factor_; }
  const std::vector<double> &bid_history() const { return bid_history_; }
  double average_bid() const;

protected:
  double bid_for(const Player &p) override;

private:
  double initial_bid_factor_{1.0};
  std::vector<double> bid_history_;
  double history_sum_{0.0};
};

// Flat 80% of value.
class ValueBased : public BiddingStrategy {
public:
  ValueBased(const PlayerPool &pool, double initial_budget,
             RoleRequirements requirements = RoleRequirements());

  std::string name() const override { return "ValueBased"; }

protected:
  double bid_for(const Player &p) override { return 0.8 * p.value; }
};

// Flat 90% of value. No optimization is run despite the name.
class OptimalTeamCompositionLP : public BiddingStrategy {
public:
  OptimalTeamCompositionLP(const PlayerPool &pool, double initial_budget,
                           RoleRequirements requirements = RoleRequirements());

  std::string name() const override { return "OptimalTeamCompositionLP"; }

protected:
  double bid_for(const Player &p) override { return 0.9 * p.value; }
};

} // namespace draft_bandit

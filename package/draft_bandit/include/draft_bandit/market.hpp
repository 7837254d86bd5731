#pragma once

#include <cstdint>
#include <random>

#include "draft_bandit/player.hpp"

namespace draft_bandit {

// The rest of the market, reduced to one synthetic bid per player:
// value * U(low_factor, high_factor), drawn from a seeded engine. The seed
// is mixed first, so a strategy engine seeded with the same number draws an
// unrelated stream.
class CompetitiveMarket {
public:
  CompetitiveMarket(double low_factor, double high_factor, std::uint64_t seed);

  double next_bid(const Player &p);

  double low_factor() const { return low_factor_; }
  double high_factor() const { return high_factor_; }

private:
  double low_factor_{0.7};
  double high_factor_{1.2};
  std::mt19937_64 rng_;
};

} // namespace draft_bandit

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "draft_bandit/player.hpp"

namespace draft_bandit {

struct PoolGenConfig {
  int count{100};
  int value_low{80};   // inclusive
  int value_high{150}; // inclusive
  double cost_factor_low{0.6};
  double cost_factor_high{0.9};
  std::vector<std::string> roles = all_role_names();
};

// Synthetic pool: integer value uniform on [value_low, value_high],
// cost = floor(value * U(cost_factor_low, cost_factor_high)), role uniform
// over cfg.roles. Same cfg and seed give the same pool.
PlayerPool generate_player_pool(const PoolGenConfig &cfg, std::uint64_t seed);

} // namespace draft_bandit

#include "draft_bandit/pool_generator.hpp"
#include "draft_bandit/errors.hpp"

#include <cmath>
#include <random>

#include <fmt/format.h>

namespace draft_bandit {

namespace {

void validate(const PoolGenConfig &cfg) {
  if (cfg.count <= 0) {
    throw ConfigurationError(
        fmt::format("Player count must be positive, got {}", cfg.count));
  }
  if (cfg.roles.empty())
    throw ConfigurationError("At least one role is required");
  if (!(cfg.value_low > 0 && cfg.value_low <= cfg.value_high)) {
    throw ConfigurationError(
        fmt::format("Value range must satisfy 0 < low <= high, got [{}, {}]",
                    cfg.value_low, cfg.value_high));
  }
  if (!(cfg.cost_factor_low > 0.0 &&
        cfg.cost_factor_low <= cfg.cost_factor_high)) {
    throw ConfigurationError(fmt::format(
        "Cost factor range must satisfy 0 < low <= high, got [{}, {}]",
        cfg.cost_factor_low, cfg.cost_factor_high));
  }
  // The cheapest possible player must still cost something
  if (std::floor(cfg.value_low * cfg.cost_factor_low) < 1.0) {
    throw ConfigurationError(fmt::format(
        "value_low * cost_factor_low = {} can produce zero-cost players",
        cfg.value_low * cfg.cost_factor_low));
  }
}

} // namespace

PlayerPool generate_player_pool(const PoolGenConfig &cfg, std::uint64_t seed) {
  validate(cfg);
  std::vector<Role> roles;
  roles.reserve(cfg.roles.size());
  for (const auto &r : cfg.roles)
    roles.push_back(role_from_string(r));

  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int> value_dist(cfg.value_low, cfg.value_high);
  std::uniform_real_distribution<double> cost_dist(cfg.cost_factor_low,
                                                   cfg.cost_factor_high);
  std::uniform_int_distribution<std::size_t> role_dist(0, roles.size() - 1);

  std::vector<Player> players;
  players.reserve(static_cast<std::size_t>(cfg.count));
  for (int i = 0; i < cfg.count; ++i) {
    const int value = value_dist(rng);
    const double cost = std::floor(value * cost_dist(rng));
    players.emplace_back(value, cost, roles[role_dist(rng)]);
  }
  return PlayerPool(players);
}

} // namespace draft_bandit

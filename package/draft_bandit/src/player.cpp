#include "draft_bandit/player.hpp"
#include "draft_bandit/errors.hpp"

#include <fmt/format.h>

namespace draft_bandit {

namespace {

const char *const kRoleNames[kNumRoles] = {"forward", "midfielder", "defender",
                                           "goalkeeper"};

} // namespace

Role role_from_string(const std::string &name) {
  for (int i = 0; i < kNumRoles; ++i) {
    if (name == kRoleNames[i])
      return static_cast<Role>(i);
  }
  throw ConfigurationError(fmt::format("Unknown role '{}'", name));
}

std::string role_name(Role r) {
  const int i = role_index(r);
  if (i < 0 || i >= kNumRoles)
    throw ConfigurationError(fmt::format("Unknown role index {}", i));
  return kRoleNames[i];
}

std::vector<std::string> all_role_names() {
  return std::vector<std::string>(kRoleNames, kRoleNames + kNumRoles);
}

PlayerPool::PlayerPool(const std::vector<Player> &players) {
  players_.reserve(players.size());
  for (const auto &p : players)
    append(p);
}

void PlayerPool::append(const Player &p) {
  if (!(p.value > 0.0)) {
    throw ConfigurationError(fmt::format(
        "Player {}: value must be positive, got {}", players_.size(), p.value));
  }
  if (!(p.cost > 0.0)) {
    throw ConfigurationError(fmt::format(
        "Player {}: cost must be positive, got {}", players_.size(), p.cost));
  }
  // Rejects out-of-range enum values coming through the bindings
  role_name(p.role);
  players_.push_back(p);
}

const Player &PlayerPool::at(std::size_t idx) const {
  if (idx >= players_.size()) {
    throw IndexOutOfRange(fmt::format(
        "Player index {} out of range for pool of size {}", idx,
        players_.size()));
  }
  return players_[idx];
}

Eigen::VectorXd PlayerPool::values() const {
  Eigen::VectorXd out(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    out[static_cast<Eigen::Index>(i)] = players_[i].value;
  return out;
}

Eigen::VectorXd PlayerPool::costs() const {
  Eigen::VectorXd out(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    out[static_cast<Eigen::Index>(i)] = players_[i].cost;
  return out;
}

Eigen::VectorXi PlayerPool::role_idx() const {
  Eigen::VectorXi out(static_cast<Eigen::Index>(players_.size()));
  for (std::size_t i = 0; i < players_.size(); ++i)
    out[static_cast<Eigen::Index>(i)] = role_index(players_[i].role);
  return out;
}

} // namespace draft_bandit

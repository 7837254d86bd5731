#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace draft_bandit {

enum class Role : int {
  kForward = 0,
  kMidfielder = 1,
  kDefender = 2,
  kGoalkeeper = 3,
};

constexpr int kNumRoles = 4;

inline int role_index(Role r) { return static_cast<int>(r); }

// Parses "forward", "midfielder", "defender" or "goalkeeper".
// Throws ConfigurationError on anything else.
Role role_from_string(const std::string &name);
std::string role_name(Role r);
std::vector<std::string> all_role_names();

struct Player {
  double value{0.0};
  double cost{0.0};
  Role role{Role::kForward};

  Player() = default;
  Player(double value_, double cost_, Role role_)
      : value(value_), cost(cost_), role(role_) {}
  // Throws ConfigurationError for an unknown role name.
  Player(double value_, double cost_, const std::string &role_)
      : value(value_), cost(cost_), role(role_from_string(role_)) {}
};

// Fixed once constructed: strategies refer to players by index and keep a
// pointer to the pool, so there is no way to append or edit records.
class PlayerPool {
public:
  PlayerPool() = default;
  // Throws ConfigurationError unless every value and cost is positive.
  explicit PlayerPool(const std::vector<Player> &players);

  std::size_t size() const { return players_.size(); }
  bool empty() const { return players_.empty(); }

  // Throws IndexOutOfRange past the end.
  const Player &at(std::size_t idx) const;

  std::vector<Player> players() const { return players_; }

  // Aligned by player index.
  Eigen::VectorXd values() const;
  Eigen::VectorXd costs() const;
  Eigen::VectorXi role_idx() const;

private:
  void append(const Player &p);

  std::vector<Player> players_;
};

} // namespace draft_bandit

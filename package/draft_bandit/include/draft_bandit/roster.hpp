#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

#include "draft_bandit/player.hpp"

namespace draft_bandit {

// Maximum number of players of each role a single roster may hold.
class RoleRequirements {
public:
  // forward:3, midfielder:4, defender:3, goalkeeper:1
  RoleRequirements();
  explicit RoleRequirements(const Eigen::ArrayXi &caps);

  // Roles missing from the map get no slots at all.
  static RoleRequirements
  from_map(const std::unordered_map<std::string, int> &caps);

  int cap(Role r) const { return caps_[role_index(r)]; }
  const Eigen::ArrayXi &caps() const { return caps_; }
  int total_slots() const { return caps_.sum(); }

private:
  Eigen::ArrayXi caps_; // length = kNumRoles
};

enum class BudgetPolicy : int {
  kUnchecked = 0, // budgets may go negative
  kStrict = 1,    // overdrawing acquisitions raise InvariantViolation
};

// Players acquired by one strategy and what is left of its budget.
class Roster {
public:
  Roster(double initial_budget, RoleRequirements requirements);

  bool can_add(Role r) const {
    return role_counts_[role_index(r)] < requirements_.cap(r);
  }

  // Appends player_idx and charges p.cost. Throws InvariantViolation when
  // the role is full, or when the budget would go negative under kStrict.
  void add(std::size_t player_idx, const Player &p,
           BudgetPolicy policy = BudgetPolicy::kUnchecked);

  void reset();

  const std::vector<std::size_t> &acquired() const { return acquired_; }
  double remaining_budget() const { return remaining_budget_; }
  double initial_budget() const { return initial_budget_; }
  double spent() const { return initial_budget_ - remaining_budget_; }
  int count(Role r) const { return role_counts_[role_index(r)]; }
  const Eigen::ArrayXi &role_counts() const { return role_counts_; }
  Eigen::ArrayXi open_slots() const {
    return requirements_.caps() - role_counts_;
  }
  const RoleRequirements &requirements() const { return requirements_; }

private:
  RoleRequirements requirements_;
  double initial_budget_{0.0};
  double remaining_budget_{0.0};
  std::vector<std::size_t> acquired_;
  Eigen::ArrayXi role_counts_; // length = kNumRoles
};

} // namespace draft_bandit

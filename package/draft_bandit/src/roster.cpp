#include "draft_bandit/roster.hpp"
#include "draft_bandit/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace draft_bandit {

RoleRequirements::RoleRequirements() : caps_(kNumRoles) {
  caps_ << 3, 4, 3, 1;
}

RoleRequirements::RoleRequirements(const Eigen::ArrayXi &caps) : caps_(caps) {
  if (caps_.size() != kNumRoles) {
    throw ConfigurationError(fmt::format(
        "RoleRequirements: expected {} caps, got {}", kNumRoles, caps_.size()));
  }
  if ((caps_ < 0).any())
    throw ConfigurationError("RoleRequirements: caps must be non-negative");
}

RoleRequirements
RoleRequirements::from_map(const std::unordered_map<std::string, int> &caps) {
  Eigen::ArrayXi arr = Eigen::ArrayXi::Zero(kNumRoles);
  for (const auto &kv : caps)
    arr[role_index(role_from_string(kv.first))] = kv.second;
  return RoleRequirements(arr);
}

Roster::Roster(double initial_budget, RoleRequirements requirements)
    : requirements_(std::move(requirements)), initial_budget_(initial_budget),
      remaining_budget_(initial_budget),
      role_counts_(Eigen::ArrayXi::Zero(kNumRoles)) {
  if (!(initial_budget > 0.0)) {
    throw ConfigurationError(fmt::format(
        "Initial budget must be positive, got {}", initial_budget));
  }
}

void Roster::add(std::size_t player_idx, const Player &p, BudgetPolicy policy) {
  if (!can_add(p.role)) {
    throw InvariantViolation(
        fmt::format("Roster already holds {} {} player(s); cannot add player {}",
                    count(p.role), role_name(p.role), player_idx));
  }
  if (policy == BudgetPolicy::kStrict && p.cost > remaining_budget_) {
    throw InvariantViolation(fmt::format(
        "Acquiring player {} (cost {}) would overdraw remaining budget {}",
        player_idx, p.cost, remaining_budget_));
  }
  acquired_.push_back(player_idx);
  remaining_budget_ -= p.cost;
  role_counts_[role_index(p.role)] += 1;
}

void Roster::reset() {
  acquired_.clear();
  remaining_budget_ = initial_budget_;
  role_counts_.setZero();
}

} // namespace draft_bandit

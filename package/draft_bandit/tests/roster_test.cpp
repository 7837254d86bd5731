#include "draft_bandit/errors.hpp"
#include "draft_bandit/roster.hpp"
#include <gtest/gtest.h>

using namespace draft_bandit;

TEST(RoleRequirementsTest, DefaultCaps) {
  RoleRequirements req;
  EXPECT_EQ(req.cap(Role::kForward), 3);
  EXPECT_EQ(req.cap(Role::kMidfielder), 4);
  EXPECT_EQ(req.cap(Role::kDefender), 3);
  EXPECT_EQ(req.cap(Role::kGoalkeeper), 1);
  EXPECT_EQ(req.total_slots(), 11);
}

TEST(RoleRequirementsTest, MissingRolesGetNoSlots) {
  RoleRequirements req = RoleRequirements::from_map({{"forward", 1}});
  EXPECT_EQ(req.cap(Role::kForward), 1);
  EXPECT_EQ(req.cap(Role::kMidfielder), 0);
  EXPECT_EQ(req.cap(Role::kGoalkeeper), 0);
}

TEST(RoleRequirementsTest, RejectsBadCaps) {
  EXPECT_THROW(RoleRequirements::from_map({{"libero", 1}}), ConfigurationError);
  EXPECT_THROW(RoleRequirements::from_map({{"forward", -1}}),
               ConfigurationError);
  Eigen::ArrayXi short_caps(2);
  short_caps << 1, 1;
  EXPECT_THROW(RoleRequirements{short_caps}, ConfigurationError);
}

class RosterTest : public ::testing::Test {
protected:
  Player forward{100, 70, Role::kForward};
  Player keeper{90, 60, Role::kGoalkeeper};
};

TEST_F(RosterTest, AddChargesCostAndRecordsOrder) {
  Roster roster(1000, RoleRequirements());
  roster.add(4, forward);
  roster.add(2, keeper);
  ASSERT_EQ(roster.acquired().size(), 2u);
  EXPECT_EQ(roster.acquired()[0], 4u);
  EXPECT_EQ(roster.acquired()[1], 2u);
  EXPECT_DOUBLE_EQ(roster.remaining_budget(), 870);
  EXPECT_DOUBLE_EQ(roster.spent(), 130);
  EXPECT_EQ(roster.count(Role::kForward), 1);
  EXPECT_EQ(roster.open_slots()[role_index(Role::kGoalkeeper)], 0);
}

TEST_F(RosterTest, FullRoleIsClosed) {
  Roster roster(1000, RoleRequirements());
  EXPECT_TRUE(roster.can_add(Role::kGoalkeeper));
  roster.add(0, keeper);
  EXPECT_FALSE(roster.can_add(Role::kGoalkeeper));
  EXPECT_THROW(roster.add(1, keeper), InvariantViolation);
  EXPECT_EQ(roster.acquired().size(), 1u);
}

TEST_F(RosterTest, UncheckedBudgetMayGoNegative) {
  Roster roster(100, RoleRequirements());
  roster.add(0, forward);
  roster.add(1, forward);
  EXPECT_DOUBLE_EQ(roster.remaining_budget(), -40);
}

TEST_F(RosterTest, StrictBudgetRejectsOverdraw) {
  Roster roster(100, RoleRequirements());
  roster.add(0, forward, BudgetPolicy::kStrict);
  EXPECT_THROW(roster.add(1, forward, BudgetPolicy::kStrict),
               InvariantViolation);
  EXPECT_DOUBLE_EQ(roster.remaining_budget(), 30);
  EXPECT_EQ(roster.acquired().size(), 1u);
}

TEST_F(RosterTest, NonPositiveBudgetIsConfigurationError) {
  EXPECT_THROW(Roster(0, RoleRequirements()), ConfigurationError);
  EXPECT_THROW(Roster(-5, RoleRequirements()), ConfigurationError);
}

TEST_F(RosterTest, ResetRestoresInitialState) {
  Roster roster(500, RoleRequirements());
  roster.add(0, keeper);
  roster.reset();
  EXPECT_TRUE(roster.acquired().empty());
  EXPECT_DOUBLE_EQ(roster.remaining_budget(), 500);
  EXPECT_TRUE(roster.can_add(Role::kGoalkeeper));
}

#include "draft_bandit/bandit.hpp"
#include "draft_bandit/errors.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

using namespace draft_bandit;

class BanditTest : public ::testing::Test {
protected:
  void SetUp() override { pool = PlayerPool({Player(100, 70, "forward")}); }

  std::vector<std::shared_ptr<BiddingStrategy>> make_arms(std::size_t k) {
    std::vector<std::shared_ptr<BiddingStrategy>> arms;
    for (std::size_t i = 0; i < k; ++i)
      arms.push_back(std::make_shared<ValueBased>(pool, 1000));
    return arms;
  }

  PlayerPool pool;
};

TEST_F(BanditTest, ExploresEveryArmOnceInIndexOrder) {
  for (std::size_t k = 1; k <= 6; ++k) {
    Ucb1Selector bandit(make_arms(k));
    for (std::size_t expected = 0; expected < k; ++expected) {
      const std::size_t arm = bandit.select_arm();
      EXPECT_EQ(arm, expected);
      // Exploration order does not depend on the rewards seen so far
      bandit.update(arm, expected % 2 == 0 ? 1.0 : 0.0);
    }
    EXPECT_EQ(bandit.total_count(), static_cast<long>(k));
  }
}

TEST_F(BanditTest, TieAfterExplorationGoesToLowestIndex) {
  Ucb1Selector bandit(make_arms(3));
  bandit.update(bandit.select_arm(), 1.0);
  bandit.update(bandit.select_arm(), 0.0);
  bandit.update(bandit.select_arm(), 1.0);
  EXPECT_DOUBLE_EQ(bandit.arm(0).mean_reward, 1.0);
  EXPECT_DOUBLE_EQ(bandit.arm(1).mean_reward, 0.0);
  EXPECT_DOUBLE_EQ(bandit.arm(2).mean_reward, 1.0);
  EXPECT_EQ(bandit.select_arm(), 0u);
}

TEST_F(BanditTest, ScoresFollowUcb1Formula) {
  Ucb1Selector bandit(make_arms(2));
  EXPECT_TRUE(std::isinf(bandit.ucb_scores()[0]));
  bandit.update(0, 1.0);
  bandit.update(1, 0.0);
  bandit.update(1, 1.0);
  const Eigen::ArrayXd scores = bandit.ucb_scores();
  EXPECT_NEAR(scores[0], 1.0 + std::sqrt(2.0 * std::log(3.0) / 1.0), 1e-12);
  EXPECT_NEAR(scores[1], 0.5 + std::sqrt(2.0 * std::log(3.0) / 2.0), 1e-12);
  EXPECT_EQ(bandit.select_arm(), 0u);
}

TEST_F(BanditTest, ZeroExplorationIsGreedy) {
  Ucb1Selector bandit(make_arms(3), 0.0);
  bandit.update(0, 0.0);
  bandit.update(1, 1.0);
  bandit.update(2, 0.0);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(bandit.select_arm(), 1u);
    bandit.update(1, 1.0);
  }
}

TEST_F(BanditTest, IncrementalMeanMatchesRecomputedMean) {
  const std::size_t k = 4;
  Ucb1Selector bandit(make_arms(k));
  std::vector<std::vector<double>> history(k);
  std::mt19937 rng(2024);
  std::uniform_int_distribution<std::size_t> pick(0, k - 1);
  std::uniform_real_distribution<double> reward(0.0, 1.0);

  for (int step = 0; step < 5000; ++step) {
    const std::size_t arm = (step % 3 == 0) ? pick(rng) : bandit.select_arm();
    // Mix binary and fractional rewards
    const double r = (step % 2 == 0) ? (reward(rng) < 0.4 ? 1.0 : 0.0)
                                     : reward(rng);
    bandit.update(arm, r);
    history[arm].push_back(r);

    if (step % 250 == 0 || step == 4999) {
      for (std::size_t a = 0; a < k; ++a) {
        if (history[a].empty())
          continue;
        double sum = 0.0;
        for (double x : history[a])
          sum += x;
        const double direct = sum / static_cast<double>(history[a].size());
        EXPECT_NEAR(bandit.arm(a).mean_reward, direct, 1e-9);
        EXPECT_EQ(bandit.arm(a).count, static_cast<int>(history[a].size()));
      }
    }
  }
  EXPECT_EQ(bandit.counts().sum(), 5000);
  EXPECT_EQ(bandit.total_count(), 5000);
}

TEST_F(BanditTest, RejectsBadInput) {
  std::vector<std::shared_ptr<BiddingStrategy>> none;
  EXPECT_THROW(Ucb1Selector bad(none), ConfigurationError);
  EXPECT_THROW(Ucb1Selector(make_arms(2), -1.0), ConfigurationError);

  Ucb1Selector bandit(make_arms(2));
  EXPECT_THROW(bandit.update(2, 1.0), IndexOutOfRange);
  EXPECT_THROW(bandit.update(0, 1.5), std::invalid_argument);
  EXPECT_THROW(bandit.update(0, -0.1), std::invalid_argument);
  EXPECT_THROW(bandit.arm(5), IndexOutOfRange);
  EXPECT_EQ(bandit.total_count(), 0);
}

TEST_F(BanditTest, ResetClearsStatistics) {
  Ucb1Selector bandit(make_arms(2));
  bandit.update(0, 1.0);
  bandit.update(1, 1.0);
  bandit.reset();
  EXPECT_EQ(bandit.total_count(), 0);
  EXPECT_EQ(bandit.arm(0).count, 0);
  EXPECT_EQ(bandit.select_arm(), 0u);
}

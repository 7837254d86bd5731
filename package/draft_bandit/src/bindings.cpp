#include "draft_bandit/auction.hpp"
#include "draft_bandit/bandit.hpp"
#include "draft_bandit/errors.hpp"
#include "draft_bandit/player.hpp"
#include "draft_bandit/pool_generator.hpp"
#include "draft_bandit/roster.hpp"
#include "draft_bandit/simulator.hpp"
#include "draft_bandit/strategy.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
namespace db = draft_bandit;

NB_MODULE(draft_bandit_ext, m) {
  m.doc() = "Repeated single-item auction with a UCB1 strategy selector.";

  nb::exception<db::ConfigurationError>(m, "ConfigurationError",
                                        PyExc_ValueError);
  nb::exception<db::IndexOutOfRange>(m, "IndexOutOfRange", PyExc_IndexError);
  nb::exception<db::InvariantViolation>(m, "InvariantViolation",
                                        PyExc_RuntimeError);

  nb::enum_<db::Role>(m, "Role")
      .value("FORWARD", db::Role::kForward)
      .value("MIDFIELDER", db::Role::kMidfielder)
      .value("DEFENDER", db::Role::kDefender)
      .value("GOALKEEPER", db::Role::kGoalkeeper);
  m.def("role_from_string", &db::role_from_string);
  m.def("role_name", &db::role_name);

  // Player
  nb::class_<db::Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<double, double, db::Role>(), nb::arg("value"),
           nb::arg("cost"), nb::arg("role"))
      .def(nb::init<double, double, const std::string &>(), nb::arg("value"),
           nb::arg("cost"), nb::arg("role"))
      .def_ro("value", &db::Player::value)
      .def_ro("cost", &db::Player::cost)
      .def_ro("role", &db::Player::role)
      .def("__repr__", [](const db::Player &p) {
        return fmt::format("Player(value={}, cost={}, role={})", p.value,
                           p.cost, db::role_name(p.role));
      });

  // PlayerPool
  nb::class_<db::PlayerPool>(m, "PlayerPool")
      .def(nb::init<>())
      .def(nb::init<const std::vector<db::Player> &>(), nb::arg("players"))
      .def("size", &db::PlayerPool::size)
      .def("__len__", &db::PlayerPool::size)
      .def("at", &db::PlayerPool::at, nb::arg("idx"))
      .def("players", &db::PlayerPool::players)
      .def("values", &db::PlayerPool::values)
      .def("costs", &db::PlayerPool::costs)
      .def("role_idx", &db::PlayerPool::role_idx)
      .def("__repr__", [](const db::PlayerPool &p) {
        return fmt::format("PlayerPool(size={})", p.size());
      });

  nb::class_<db::PoolGenConfig>(m, "PoolGenConfig")
      .def(nb::init<>())
      .def_rw("count", &db::PoolGenConfig::count)
      .def_rw("value_low", &db::PoolGenConfig::value_low)
      .def_rw("value_high", &db::PoolGenConfig::value_high)
      .def_rw("cost_factor_low", &db::PoolGenConfig::cost_factor_low)
      .def_rw("cost_factor_high", &db::PoolGenConfig::cost_factor_high)
      .def_rw("roles", &db::PoolGenConfig::roles);
  m.def("generate_player_pool", &db::generate_player_pool, nb::arg("cfg"),
        nb::arg("seed"));

  // Rosters
  nb::class_<db::RoleRequirements>(m, "RoleRequirements")
      .def(nb::init<>())
      .def(nb::init<const Eigen::ArrayXi &>(), nb::arg("caps"))
      .def_static("from_map", &db::RoleRequirements::from_map,
                  nb::arg("caps"))
      .def("cap", &db::RoleRequirements::cap)
      .def("caps", &db::RoleRequirements::caps)
      .def("total_slots", &db::RoleRequirements::total_slots);

  nb::enum_<db::BudgetPolicy>(m, "BudgetPolicy")
      .value("UNCHECKED", db::BudgetPolicy::kUnchecked)
      .value("STRICT", db::BudgetPolicy::kStrict);

  nb::class_<db::Roster>(m, "Roster")
      .def("can_add", &db::Roster::can_add)
      .def("acquired", &db::Roster::acquired)
      .def("remaining_budget", &db::Roster::remaining_budget)
      .def("initial_budget", &db::Roster::initial_budget)
      .def("spent", &db::Roster::spent)
      .def("count", &db::Roster::count)
      .def("role_counts", &db::Roster::role_counts)
      .def("open_slots", &db::Roster::open_slots);

  // Strategies. Each keeps a pointer to its pool, so the pool lives at least
  // as long as the strategy.
  nb::class_<db::BiddingStrategy>(m, "BiddingStrategy")
      .def("name", &db::BiddingStrategy::name)
      .def("can_acquire", &db::BiddingStrategy::can_acquire)
      .def("compute_bid", &db::BiddingStrategy::compute_bid)
      .def("observe_bid", &db::BiddingStrategy::observe_bid, nb::arg("bid"),
           nb::arg("won"))
      .def("acquire", &db::BiddingStrategy::acquire, nb::arg("player_idx"),
           nb::arg("policy") = db::BudgetPolicy::kUnchecked)
      .def("reset", &db::BiddingStrategy::reset)
      .def("roster", &db::BiddingStrategy::roster,
           nb::rv_policy::reference_internal);

  nb::class_<db::EpsilonGreedy, db::BiddingStrategy>(m, "EpsilonGreedy")
      .def(nb::init<const db::PlayerPool &, double, double, double,
                    std::uint64_t, db::RoleRequirements>(),
           nb::arg("pool"), nb::arg("initial_budget"),
           nb::arg("epsilon") = 0.1, nb::arg("exploitation_factor") = 0.8,
           nb::arg("seed") = 0,
           nb::arg("requirements") = db::RoleRequirements(),
           nb::keep_alive<1, 2>())
      .def_prop_ro("epsilon", &db::EpsilonGreedy::epsilon)
      .def_prop_ro("exploitation_factor",
                   &db::EpsilonGreedy::exploitation_factor);

  nb::class_<db::Reactive, db::BiddingStrategy>(m, "Reactive")
      .def(nb::init<const db::PlayerPool &, double, double,
                    db::RoleRequirements>(),
           nb::arg("pool"), nb::arg("initial_budget"),
           nb::arg("initial_bid_factor") = 1.0,
           nb::arg("requirements") = db::RoleRequirements(),
           nb::keep_alive<1, 2>())
      .def("bid_history", &db::Reactive::bid_history)
      .def("average_bid", &db::Reactive::average_bid);

  nb::class_<db::ValueBased, db::BiddingStrategy>(m, "ValueBased")
      .def(nb::init<const db::PlayerPool &, double, db::RoleRequirements>(),
           nb::arg("pool"), nb::arg("initial_budget"),
           nb::arg("requirements") = db::RoleRequirements(),
           nb::keep_alive<1, 2>());

  nb::class_<db::OptimalTeamCompositionLP, db::BiddingStrategy>(
      m, "OptimalTeamCompositionLP")
      .def(nb::init<const db::PlayerPool &, double, db::RoleRequirements>(),
           nb::arg("pool"), nb::arg("initial_budget"),
           nb::arg("requirements") = db::RoleRequirements(),
           nb::keep_alive<1, 2>());

  // Bandit
  nb::class_<db::ArmState>(m, "ArmState")
      .def(nb::init<>())
      .def_rw("count", &db::ArmState::count)
      .def_rw("mean_reward", &db::ArmState::mean_reward)
      .def("__repr__", [](const db::ArmState &a) {
        return fmt::format("ArmState(count={}, mean_reward={})", a.count,
                           a.mean_reward);
      });

  nb::class_<db::Ucb1Selector>(m, "Ucb1Selector")
      .def(nb::init<std::vector<std::shared_ptr<db::BiddingStrategy>>,
                    double>(),
           nb::arg("strategies"), nb::arg("exploration") = 2.0)
      .def("num_arms", &db::Ucb1Selector::num_arms)
      .def("select_arm", &db::Ucb1Selector::select_arm)
      .def("update", &db::Ucb1Selector::update, nb::arg("arm"),
           nb::arg("reward"))
      .def("ucb_scores", &db::Ucb1Selector::ucb_scores)
      .def("arm", &db::Ucb1Selector::arm)
      .def("arms", &db::Ucb1Selector::arms)
      .def("counts", &db::Ucb1Selector::counts)
      .def("mean_rewards", &db::Ucb1Selector::mean_rewards)
      .def("total_count", &db::Ucb1Selector::total_count)
      .def("strategies", &db::Ucb1Selector::strategies)
      .def("reset", &db::Ucb1Selector::reset);

  // Simulation config/result
  nb::class_<db::SimConfig>(m, "SimConfig")
      .def(nb::init<>())
      .def_rw("rounds", &db::SimConfig::rounds)
      .def_rw("seed", &db::SimConfig::seed)
      .def_rw("competitive_low", &db::SimConfig::competitive_low)
      .def_rw("competitive_high", &db::SimConfig::competitive_high)
      .def_rw("budget_policy", &db::SimConfig::budget_policy)
      .def_rw("verbose", &db::SimConfig::verbose);

  nb::class_<db::RoundRecord>(m, "RoundRecord")
      .def(nb::init<>())
      .def_rw("player_idx", &db::RoundRecord::player_idx)
      .def_rw("arm", &db::RoundRecord::arm)
      .def_rw("bid", &db::RoundRecord::bid)
      .def_rw("competitive_bid", &db::RoundRecord::competitive_bid)
      .def_rw("reward", &db::RoundRecord::reward);

  nb::class_<db::StrategyOutcome>(m, "StrategyOutcome")
      .def(nb::init<>())
      .def_rw("name", &db::StrategyOutcome::name)
      .def_rw("acquired_players", &db::StrategyOutcome::acquired_players)
      .def_rw("remaining_budget", &db::StrategyOutcome::remaining_budget);

  nb::class_<db::SimSummary>(m, "SimSummary")
      .def(nb::init<>())
      .def_rw("strategies", &db::SimSummary::strategies)
      .def_rw("arms", &db::SimSummary::arms)
      .def_rw("rounds", &db::SimSummary::rounds)
      .def_rw("final_owner", &db::SimSummary::final_owner)
      .def_rw("winning_bid", &db::SimSummary::winning_bid);

  m.def("run_round", &db::run_round, nb::arg("player_idx"),
        nb::arg("competitive_bid"), nb::arg("bandit"),
        nb::arg("policy") = db::BudgetPolicy::kUnchecked);
  m.def(
      "run_simulation",
      [](db::Ucb1Selector &bandit, const db::PlayerPool &pool,
         const db::SimConfig &cfg) {
        return db::run_simulation(bandit, pool, cfg);
      },
      nb::arg("bandit"), nb::arg("pool"), nb::arg("cfg"));
  m.def(
      "run_simulation",
      [](db::Ucb1Selector &bandit, const db::PlayerPool &pool, int rounds) {
        return db::run_simulation(bandit, pool, rounds);
      },
      nb::arg("bandit"), nb::arg("pool"), nb::arg("rounds"));
  m.def(
      "run_simulation",
      [](db::Ucb1Selector &bandit, const db::PlayerPool &pool) {
        return db::run_simulation(bandit, pool);
      },
      nb::arg("bandit"), nb::arg("pool"));
}

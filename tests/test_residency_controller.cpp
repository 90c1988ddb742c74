/// @file test_residency_controller.cpp
/// @brief Unit tests for ResidencyController: leases, hotness, promotion,
///        eviction, plan application and transport failure handling.

#include "controller/residency_controller.hpp"
#include "planner/placement_planner.hpp"
#include "transport/simulated_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace frag_res;

namespace {

auto fragment(std::string id, std::uint64_t size = 4096) -> Fragment {
  return Fragment{.id = std::move(id),
                  .size = size,
                  .importance = 0.5,
                  .reuse = 1,
                  .timescale = "short"};
}

auto has_event(const EpochReport &r, EventKind kind, const FragmentId &id)
    -> bool {
  return std::any_of(r.events.begin(), r.events.end(),
                     [&](const ControllerEvent &e) {
                       return e.kind == kind && e.fragment == id;
                     });
}

/// Transport that blocks every call until opened.
class GatedTransport final : public Transport {
public:
  auto migrate(const TransferRequest &)
      -> std::expected<TransferReceipt, TransportErrc> override {
    std::unique_lock lock(mu_);
    cv_.wait(lock, [this] { return open_; });
    return TransferReceipt{.latency_s = 0.0};
  }

  void open() {
    {
      std::lock_guard lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_ = false;
};

struct GateGuard {
  GatedTransport &transport;
  ~GateGuard() { transport.open(); }
};

} // namespace

class ResidencyControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    nodes_ = {
        Node{.id = 0, .capacity_budget = 0, .backing = true},
        Node{.id = 1, .capacity_budget = 40000},
        Node{.id = 2, .capacity_budget = 40000},
    };
    for (const auto &n : nodes_) {
      ASSERT_TRUE(map_.add_node(n).has_value());
    }
    cfg_.fast_node = 1;
    cfg_.fallback_node = 0;
    cfg_.promotion_interval = 5;
    cfg_.promotion_fanout = 4;
  }

  /// Install @p f on @p node and track it with @p seed.
  void add(ResidencyController &c, const Fragment &f, NodeId node,
           FragmentSeed seed) {
    const CostModel model;
    const auto n = map_.node(node);
    ASSERT_TRUE(n.has_value());
    ASSERT_TRUE(
        map_.install(f.id, node, model.cost(f, *n), model.units(f)).has_value());
    ASSERT_TRUE(c.track(f, seed).has_value());
  }

  /// Advance @p c to @p epoch with empty access batches.
  static void advance_to(ResidencyController &c, Epoch epoch) {
    while (c.epoch() < epoch) {
      (void)c.step({});
    }
  }

  std::vector<Node> nodes_;
  ResidencyMap map_;
  SimulatedTransport transport_{{.fail_rate = 0.0, .realtime = false,
                                 .seed = 1}};
  ControllerConfig cfg_;
};

TEST_F(ResidencyControllerTest, EpochAdvancesByOne) {
  ResidencyController c{map_, transport_, cfg_};
  EXPECT_EQ(c.epoch(), 0);
  for (Epoch e = 1; e <= 7; ++e) {
    auto report = c.step({});
    EXPECT_EQ(report.epoch, e);
    EXPECT_EQ(c.epoch(), e);
  }
}

TEST_F(ResidencyControllerTest, ExpiredColdFragmentIsEvicted) {
  ResidencyController c{map_, transport_, cfg_};
  advance_to(c, 5);
  add(c, fragment("f"), 2, {.expiry = 5, .hotness = 0.3});

  auto report = c.step({});
  ASSERT_EQ(report.epoch, 6);
  EXPECT_EQ(report.evicted, std::vector<FragmentId>{"f"});
  EXPECT_EQ(c.lease("f"), Epoch{7});
  EXPECT_EQ(map_.node_of("f"), NodeId{0});
  ASSERT_EQ(report.migrations.size(), 1u);
  EXPECT_EQ(report.migrations[0].kind, MigrationKind::Eviction);
  EXPECT_TRUE(report.migrations[0].ok);
}

TEST_F(ResidencyControllerTest, ExpiredHotFragmentStays) {
  ResidencyController c{map_, transport_, cfg_};
  advance_to(c, 5);
  add(c, fragment("f"), 2, {.expiry = 5, .hotness = 0.7});

  auto report = c.step({});
  ASSERT_EQ(report.epoch, 6);
  EXPECT_TRUE(report.evicted.empty());
  EXPECT_TRUE(report.migrations.empty());
  EXPECT_EQ(c.lease("f"), Epoch{5});
  EXPECT_EQ(map_.node_of("f"), NodeId{2});
}

TEST_F(ResidencyControllerTest, LiveFragmentIsNotEvicted) {
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("f"), 2, {.expiry = 3, .hotness = 0.0});

  advance_to(c, 2);
  EXPECT_EQ(map_.node_of("f"), NodeId{2});
  auto report = c.step({});
  EXPECT_EQ(report.evicted, std::vector<FragmentId>{"f"});
}

TEST_F(ResidencyControllerTest, AccessRefreshesLeaseAndHotness) {
  ResidencyController c{map_, transport_, cfg_};
  advance_to(c, 9);
  add(c, fragment("f"), 2, {.expiry = 9, .hotness = 0.6});

  const std::vector<FragmentId> batch{"f"};
  auto report = c.step(batch);
  ASSERT_EQ(report.epoch, 10);
  EXPECT_EQ(report.accesses, 1u);
  EXPECT_EQ(c.lease("f"), Epoch{12});
  EXPECT_DOUBLE_EQ(*c.hotness("f"), 0.61);
}

TEST_F(ResidencyControllerTest, AccessNeverShortensLease) {
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("f"), 2, {.expiry = 50, .hotness = 0.0});

  const std::vector<FragmentId> batch{"f", "f"};
  (void)c.step(batch);
  EXPECT_EQ(c.lease("f"), Epoch{50});
  EXPECT_DOUBLE_EQ(*c.hotness("f"), 0.02);
}

TEST_F(ResidencyControllerTest, PromotesTopKEveryInterval) {
  ResidencyController c{map_, transport_, cfg_};
  const std::map<FragmentId, double> hotness{
      {"a", 0.9}, {"b", 0.8}, {"c", 0.95}, {"d", 0.6}, {"e", 0.7}, {"f", 0.85}};
  for (const auto &[id, h] : hotness) {
    add(c, fragment(id), 2, {.expiry = 100, .hotness = h});
  }

  for (Epoch e = 1; e <= 4; ++e) {
    auto report = c.step({});
    EXPECT_FALSE(report.promotion_round);
    EXPECT_TRUE(report.migrations.empty());
  }

  auto report = c.step({});
  ASSERT_EQ(report.epoch, 5);
  EXPECT_TRUE(report.promotion_round);
  EXPECT_EQ(report.promoted, (std::vector<FragmentId>{"c", "a", "f", "b"}));
  for (const auto &id : {"c", "a", "f", "b"}) {
    EXPECT_EQ(map_.node_of(id), NodeId{1}) << id;
  }
  EXPECT_EQ(map_.node_of("d"), NodeId{2});
  EXPECT_EQ(map_.node_of("e"), NodeId{2});
  EXPECT_EQ(report.migrations.size(), 4u);
}

TEST_F(ResidencyControllerTest, PromotedColdFragmentDefersEviction) {
  ResidencyController c{map_, transport_, cfg_};
  advance_to(c, 4);
  add(c, fragment("f"), 2, {.expiry = 5, .hotness = 0.3});

  auto report = c.step({});
  ASSERT_EQ(report.epoch, 5);
  ASSERT_TRUE(report.promotion_round);
  EXPECT_EQ(report.promoted, std::vector<FragmentId>{"f"});
  EXPECT_TRUE(report.evicted.empty());
  EXPECT_TRUE(has_event(report, EventKind::Deferred, "f"));
  EXPECT_EQ(map_.node_of("f"), NodeId{1});
  EXPECT_EQ(c.lease("f"), Epoch{5});

  // Still cold and expired: evicted on the next epoch.
  report = c.step({});
  EXPECT_EQ(report.evicted, std::vector<FragmentId>{"f"});
  EXPECT_EQ(map_.node_of("f"), NodeId{0});
  EXPECT_EQ(c.lease("f"), Epoch{7});
}

TEST_F(ResidencyControllerTest, PromotionSkipsFragmentsAlreadyFast) {
  cfg_.promotion_interval = 1;
  cfg_.promotion_fanout = 2;
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("a"), 1, {.expiry = 100, .hotness = 0.9});
  add(c, fragment("b"), 2, {.expiry = 100, .hotness = 0.8});

  auto report = c.step({});
  EXPECT_EQ(report.promoted, std::vector<FragmentId>{"b"});
  ASSERT_EQ(report.migrations.size(), 1u);
  EXPECT_EQ(report.migrations[0].fragment, "b");
}

TEST_F(ResidencyControllerTest, PromotionDisabledForSingleNode) {
  ResidencyMap single;
  ASSERT_TRUE(single.add_node({.id = 0, .capacity_budget = 0,
                               .backing = true}).has_value());
  cfg_.promotion_interval = 1;
  ResidencyController c{single, transport_, cfg_};
  ASSERT_TRUE(single.install("f", 0, 1.0).has_value());
  ASSERT_TRUE(c.track(fragment("f"), {.expiry = 100, .hotness = 1.0})
                  .has_value());

  auto report = c.step({});
  EXPECT_FALSE(report.promotion_round);
  EXPECT_TRUE(report.events.empty());
}

TEST_F(ResidencyControllerTest, EvictionOnFallbackIsANoOp) {
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("f"), 0, {.expiry = 1, .hotness = 0.0});

  auto report = c.step({});
  EXPECT_EQ(report.evicted, std::vector<FragmentId>{"f"});
  EXPECT_TRUE(report.migrations.empty());
  EXPECT_EQ(transport_.completed(), 0u);
  EXPECT_EQ(c.lease("f"), Epoch{2});
  EXPECT_EQ(map_.node_of("f"), NodeId{0});
}

TEST_F(ResidencyControllerTest, EvictedFragmentsStayTracked) {
  ResidencyController c{map_, transport_, cfg_};
  std::mt19937 rng{3};
  std::uniform_real_distribution<double> h(0.0, 0.6);
  std::uniform_int_distribution<Epoch> lease(1, 6);
  std::vector<FragmentId> ids;
  for (int i = 0; i < 8; ++i) {
    ids.push_back("f" + std::to_string(i));
    add(c, fragment(ids.back()), 1 + i % 2,
        {.expiry = lease(rng), .hotness = h(rng)});
  }

  for (int e = 0; e < 30; ++e) {
    std::vector<FragmentId> batch;
    std::map<FragmentId, std::pair<Epoch, double>> before;
    for (const auto &id : ids) {
      if (rng() % 3 == 0) {
        batch.push_back(id);
        before[id] = {*c.lease(id), *c.hotness(id)};
      }
    }

    auto report = c.step(batch);

    for (const auto &[id, prev] : before) {
      EXPECT_GE(*c.lease(id), prev.first) << id;
      EXPECT_GT(*c.hotness(id), prev.second) << id;
    }
    for (const auto &id : report.evicted) {
      EXPECT_EQ(c.lease(id), report.epoch + 1) << id;
      EXPECT_TRUE(map_.contains(id)) << id;
    }
    EXPECT_TRUE(std::is_sorted(report.evicted.begin(), report.evicted.end()));
    for (NodeId n : {1u, 2u}) {
      auto load = map_.load(n);
      EXPECT_LE(load->resident, *load->budget);
      EXPECT_DOUBLE_EQ(load->reserved, 0.0);
    }
  }
  EXPECT_EQ(c.tracked(), ids.size());
  EXPECT_EQ(map_.size(), ids.size());
}

TEST_F(ResidencyControllerTest, InsufficientCapacityIsReported) {
  ResidencyMap small;
  ASSERT_TRUE(small.add_node({.id = 0, .capacity_budget = 0,
                              .backing = true}).has_value());
  ASSERT_TRUE(small.add_node({.id = 1, .capacity_budget = 5000}).has_value());
  cfg_.promotion_interval = 1;
  cfg_.promotion_fanout = 2;
  ResidencyController c{small, transport_, cfg_};
  for (const char *id : {"a", "b"}) {
    ASSERT_TRUE(small.install(id, 0, 1.0).has_value());
    ASSERT_TRUE(c.track(fragment(id), {.expiry = 100, .hotness = 0.9})
                    .has_value());
  }

  auto report = c.step({});
  EXPECT_EQ(report.promoted, std::vector<FragmentId>{"a"});
  EXPECT_TRUE(has_event(report, EventKind::InsufficientCapacity, "b"));
  EXPECT_EQ(small.node_of("b"), NodeId{0});
  EXPECT_LE(small.load(1)->resident, 5000.0);
}

TEST_F(ResidencyControllerTest, PromotionRespectsUnitBudget) {
  ResidencyMap slots;
  ASSERT_TRUE(slots.add_node({.id = 0, .capacity_budget = 0,
                              .backing = true}).has_value());
  ASSERT_TRUE(slots.add_node({.id = 1, .capacity_budget = 100000,
                              .unit_budget = 1}).has_value());
  cfg_.promotion_interval = 1;
  cfg_.promotion_fanout = 2;
  ResidencyController c{slots, transport_, cfg_};
  const CostModel model;
  for (const char *id : {"a", "b"}) {
    const auto f = fragment(id);
    ASSERT_EQ(model.units(f), 1u);
    ASSERT_TRUE(slots.install(id, 0, 1.0, model.units(f)).has_value());
    ASSERT_TRUE(c.track(f, {.expiry = 100, .hotness = 0.9}).has_value());
  }

  auto report = c.step({});
  EXPECT_EQ(report.promoted, std::vector<FragmentId>{"a"});
  EXPECT_TRUE(has_event(report, EventKind::InsufficientCapacity, "b"));
  EXPECT_EQ(slots.node_of("b"), NodeId{0});
  EXPECT_EQ(slots.load(1)->fragments, 1u);
  EXPECT_EQ(slots.load(1)->units, 1u);
}

TEST_F(ResidencyControllerTest, UnknownTargetNodeIsReported) {
  cfg_.fast_node = 9;
  cfg_.promotion_interval = 1;
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("f"), 2, {.expiry = 100, .hotness = 0.9});

  auto report = c.step({});
  EXPECT_TRUE(has_event(report, EventKind::UnknownNode, "f"));
  EXPECT_TRUE(report.migrations.empty());
}

TEST_F(ResidencyControllerTest, UnknownAccessIsReported) {
  ResidencyController c{map_, transport_, cfg_};
  const std::vector<FragmentId> batch{"ghost"};
  auto report = c.step(batch);
  EXPECT_EQ(report.accesses, 0u);
  EXPECT_TRUE(has_event(report, EventKind::UnknownFragment, "ghost"));
}

TEST_F(ResidencyControllerTest, TransportFailureLeavesResidency) {
  SimulatedTransport failing{{.fail_rate = 1.0, .realtime = false, .seed = 1}};
  ResidencyController c{map_, failing, cfg_};
  add(c, fragment("f"), 2, {.expiry = 1, .hotness = 0.0});

  auto report = c.step({});
  EXPECT_TRUE(report.evicted.empty());
  EXPECT_TRUE(has_event(report, EventKind::TransportFailure, "f"));
  EXPECT_EQ(report.failures(), 1u);
  EXPECT_EQ(map_.node_of("f"), NodeId{2});
  EXPECT_FALSE(map_.is_migrating("f"));
  EXPECT_EQ(c.lease("f"), Epoch{1});
  EXPECT_EQ(c.record("f")->soft_failures, 1u);
  EXPECT_DOUBLE_EQ(map_.load(0)->reserved, 0.0);

  // Still eligible next epoch.
  auto again = c.step({});
  EXPECT_TRUE(has_event(again, EventKind::TransportFailure, "f"));
  EXPECT_EQ(c.record("f")->soft_failures, 2u);
}

TEST_F(ResidencyControllerTest, TimedOutMigrationDefersTheFragment) {
  GatedTransport gated;
  cfg_.promotion_interval = 1;
  cfg_.promotion_fanout = 1;
  cfg_.dispatch = {.threads = 2, .timeout = std::chrono::milliseconds(30)};
  ResidencyController c{map_, gated, cfg_};
  GateGuard guard{gated};
  add(c, fragment("f"), 2, {.expiry = 100, .hotness = 0.9});

  auto first = c.step({});
  ASSERT_EQ(first.migrations.size(), 1u);
  EXPECT_EQ(first.migrations[0].error, TransportErrc::TimedOut);
  EXPECT_TRUE(has_event(first, EventKind::TransportFailure, "f"));
  EXPECT_EQ(map_.node_of("f"), NodeId{2});
  EXPECT_FALSE(map_.is_migrating("f"));
  EXPECT_EQ(c.stragglers(), 1u);

  // The first call has not returned: no second call is issued.
  auto second = c.step({});
  EXPECT_TRUE(has_event(second, EventKind::Deferred, "f"));
  EXPECT_TRUE(second.migrations.empty());

  gated.open();
  for (int i = 0; i < 1000 && c.stragglers() > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_EQ(c.stragglers(), 0u);

  auto third = c.step({});
  EXPECT_EQ(third.promoted, std::vector<FragmentId>{"f"});
  EXPECT_EQ(map_.node_of("f"), NodeId{1});
}

TEST_F(ResidencyControllerTest, ApplyPlanPlacesFromOrigin) {
  ResidencyController c{map_, transport_, cfg_};
  std::vector<Fragment> fragments;
  for (int i = 0; i < 6; ++i) {
    fragments.push_back(fragment("f" + std::to_string(i)));
    add(c, fragments.back(), 0, {});
  }

  const PlacementPlanner planner;
  auto plan = planner.plan(fragments, nodes_);
  ASSERT_FALSE(plan.assignments.empty());

  auto report = c.apply_plan(plan);
  EXPECT_EQ(report.epoch, 0);
  EXPECT_EQ(c.epoch(), 0);
  EXPECT_EQ(report.placed.size(), plan.assignments.size());
  for (const auto &a : plan.assignments) {
    EXPECT_EQ(map_.node_of(a.fragment), a.node) << a.fragment;
  }
  for (const auto &m : report.migrations) {
    EXPECT_EQ(m.kind, MigrationKind::Placement);
    EXPECT_EQ(m.from, 0u);
  }

  // Applying the same plan again is a no-op.
  auto again = c.apply_plan(plan);
  EXPECT_TRUE(again.migrations.empty());
  EXPECT_EQ(again.placed.size(), plan.assignments.size());
}

TEST_F(ResidencyControllerTest, ApplyPlanReportsUntrackedFragments) {
  ResidencyController c{map_, transport_, cfg_};
  PlacementPlan plan;
  plan.assignments.push_back(
      {.fragment = "ghost", .node = 1, .cost = 1.0, .utility = 1.0, .rho = 1.0});
  plan.placements.emplace("ghost", 1);

  auto report = c.apply_plan(plan);
  EXPECT_TRUE(has_event(report, EventKind::UnknownFragment, "ghost"));
  EXPECT_TRUE(report.placed.empty());
}

TEST_F(ResidencyControllerTest, TrackErrors) {
  ResidencyController c{map_, transport_, cfg_};
  EXPECT_EQ(c.track(fragment("nowhere")).error(), TrackError::NotResident);

  ASSERT_TRUE(map_.install("f", 2, 1.0).has_value());
  ASSERT_TRUE(c.track(fragment("f")).has_value());
  EXPECT_EQ(c.track(fragment("f")).error(), TrackError::AlreadyTracked);

  ASSERT_TRUE(map_.install("g", 2, 1.0).has_value());
  EXPECT_EQ(c.track(fragment("g"), {.hotness = -1.0}).error(),
            TrackError::InvalidSeed);
  EXPECT_EQ(c.lease("f"), cfg_.initial_lease);
  EXPECT_FALSE(c.lease("g").has_value());
}

TEST_F(ResidencyControllerTest, HottestAndHotnessTable) {
  ResidencyController c{map_, transport_, cfg_};
  add(c, fragment("a"), 2, {.expiry = 100, .hotness = 0.5});
  add(c, fragment("b"), 2, {.expiry = 100, .hotness = 0.9});
  add(c, fragment("c"), 2, {.expiry = 100, .hotness = 0.5});

  EXPECT_EQ(c.hottest(2), (std::vector<FragmentId>{"b", "a"}));
  EXPECT_EQ(c.hottest(10).size(), 3u);
  auto table = c.hotness_table();
  ASSERT_EQ(table.size(), 3u);
  EXPECT_DOUBLE_EQ(table.at("b"), 0.9);
}

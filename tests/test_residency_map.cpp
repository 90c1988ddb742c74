/// @file test_residency_map.cpp
/// @brief Unit tests for ResidencyMap: installation, the migration state
///        machine and budget accounting.

#include "residency/residency_map.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace frag_res;

class ResidencyMapTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(map_.add_node({.id = 0, .capacity_budget = 0,
                               .backing = true}).has_value());
    ASSERT_TRUE(map_.add_node({.id = 1, .capacity_budget = 10000})
                    .has_value());
    ASSERT_TRUE(map_.add_node({.id = 2, .capacity_budget = 5000})
                    .has_value());
  }

  ResidencyMap map_;
};

TEST_F(ResidencyMapTest, Topology) {
  EXPECT_EQ(map_.node_count(), 3u);
  EXPECT_EQ(map_.node_ids(), (std::vector<NodeId>{0, 1, 2}));
  EXPECT_TRUE(map_.has_node(2));
  EXPECT_FALSE(map_.has_node(9));

  auto dup = map_.add_node({.id = 1, .capacity_budget = 1});
  ASSERT_FALSE(dup.has_value());
  EXPECT_EQ(dup.error(), ResidencyError::DuplicateNode);

  EXPECT_FALSE(map_.load(0)->budget.has_value());
  EXPECT_DOUBLE_EQ(*map_.load(1)->budget, 10000.0);
}

TEST_F(ResidencyMapTest, InstallChargesBudget) {
  ASSERT_TRUE(map_.install("a", 1, 4000.0).has_value());
  ASSERT_TRUE(map_.install("b", 1, 6000.0).has_value());

  auto over = map_.install("c", 1, 1.0);
  ASSERT_FALSE(over.has_value());
  EXPECT_EQ(over.error(), ResidencyError::BudgetExceeded);

  auto load = map_.load(1);
  EXPECT_DOUBLE_EQ(load->resident, 10000.0);
  EXPECT_EQ(load->fragments, 2u);

  EXPECT_EQ(map_.install("a", 2, 1.0).error(), ResidencyError::AlreadyPlaced);
  EXPECT_EQ(map_.install("z", 9, 1.0).error(), ResidencyError::UnknownNode);
}

TEST_F(ResidencyMapTest, BackingNodeIsUnbudgeted) {
  ASSERT_TRUE(map_.install("a", 0, 1e12).has_value());
  ASSERT_TRUE(map_.install("b", 0, 1e12).has_value());
  EXPECT_EQ(map_.load(0)->fragments, 2u);
}

TEST_F(ResidencyMapTest, MigrationCommit) {
  ASSERT_TRUE(map_.install("a", 0, 100.0).has_value());

  auto from = map_.begin_migration("a", 1, 4000.0);
  ASSERT_TRUE(from.has_value());
  EXPECT_EQ(*from, 0u);

  // Still resident on the source while in flight.
  EXPECT_EQ(map_.node_of("a"), NodeId{0});
  EXPECT_TRUE(map_.is_migrating("a"));
  EXPECT_DOUBLE_EQ(map_.load(1)->reserved, 4000.0);

  auto state = map_.state_of("a");
  ASSERT_TRUE(state.has_value());
  const auto *m = std::get_if<Migrating>(&*state);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->from, 0u);
  EXPECT_EQ(m->to, 1u);

  auto to = map_.commit_migration("a");
  ASSERT_TRUE(to.has_value());
  EXPECT_EQ(*to, 1u);
  EXPECT_EQ(map_.node_of("a"), NodeId{1});
  EXPECT_FALSE(map_.is_migrating("a"));

  auto load = map_.load(1);
  EXPECT_DOUBLE_EQ(load->resident, 4000.0);
  EXPECT_DOUBLE_EQ(load->reserved, 0.0);
  EXPECT_EQ(load->fragments, 1u);
  EXPECT_EQ(map_.load(0)->fragments, 0u);
}

TEST_F(ResidencyMapTest, MigrationAbort) {
  ASSERT_TRUE(map_.install("a", 0, 100.0).has_value());
  ASSERT_TRUE(map_.begin_migration("a", 2, 3000.0).has_value());

  auto back = map_.abort_migration("a");
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, 0u);
  EXPECT_EQ(map_.node_of("a"), NodeId{0});
  EXPECT_DOUBLE_EQ(map_.load(2)->reserved, 0.0);
  EXPECT_EQ(map_.load(2)->fragments, 0u);
}

TEST_F(ResidencyMapTest, OneMigrationAtATime) {
  ASSERT_TRUE(map_.install("a", 0, 100.0).has_value());
  ASSERT_TRUE(map_.begin_migration("a", 1, 100.0).has_value());

  auto second = map_.begin_migration("a", 2, 100.0);
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), ResidencyError::AlreadyMigrating);
  EXPECT_DOUBLE_EQ(map_.load(2)->reserved, 0.0);
}

TEST_F(ResidencyMapTest, MigrationErrors) {
  ASSERT_TRUE(map_.install("a", 1, 100.0).has_value());

  EXPECT_EQ(map_.begin_migration("zz", 2, 1.0).error(),
            ResidencyError::UnknownFragment);
  EXPECT_EQ(map_.begin_migration("a", 7, 1.0).error(),
            ResidencyError::UnknownNode);
  EXPECT_EQ(map_.begin_migration("a", 1, 1.0).error(),
            ResidencyError::SameNode);
  EXPECT_EQ(map_.commit_migration("a").error(), ResidencyError::NotMigrating);
  EXPECT_EQ(map_.abort_migration("a").error(), ResidencyError::NotMigrating);
  EXPECT_EQ(map_.commit_migration("zz").error(),
            ResidencyError::UnknownFragment);
}

TEST_F(ResidencyMapTest, ReservationCountsAgainstBudget) {
  ASSERT_TRUE(map_.install("a", 0, 1.0).has_value());
  ASSERT_TRUE(map_.install("b", 0, 1.0).has_value());

  ASSERT_TRUE(map_.begin_migration("a", 2, 3000.0).has_value());
  auto b = map_.begin_migration("b", 2, 3000.0);
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error(), ResidencyError::BudgetExceeded);

  // Releasing the reservation frees the room again.
  ASSERT_TRUE(map_.abort_migration("a").has_value());
  EXPECT_TRUE(map_.begin_migration("b", 2, 3000.0).has_value());
}

TEST_F(ResidencyMapTest, UnitBudgetIsEnforced) {
  ASSERT_TRUE(map_.add_node({.id = 3, .capacity_budget = 100000,
                             .unit_budget = 3}).has_value());
  EXPECT_EQ(map_.load(3)->unit_budget, std::optional<std::uint64_t>{3});

  ASSERT_TRUE(map_.install("a", 3, 10.0, 2).has_value());
  auto over = map_.install("b", 3, 10.0, 2);
  ASSERT_FALSE(over.has_value());
  EXPECT_EQ(over.error(), ResidencyError::BudgetExceeded);

  // Reserved units count until the migration settles.
  ASSERT_TRUE(map_.install("c", 0, 1.0, 1).has_value());
  ASSERT_TRUE(map_.install("d", 0, 1.0, 1).has_value());
  ASSERT_TRUE(map_.begin_migration("c", 3, 10.0, 1).has_value());
  EXPECT_EQ(map_.load(3)->reserved_units, 1u);
  EXPECT_EQ(map_.begin_migration("d", 3, 10.0, 1).error(),
            ResidencyError::BudgetExceeded);

  ASSERT_TRUE(map_.commit_migration("c").has_value());
  auto load = map_.load(3);
  EXPECT_EQ(load->units, 3u);
  EXPECT_EQ(load->reserved_units, 0u);
  EXPECT_EQ(load->fragments, 2u);
  EXPECT_EQ(map_.load(0)->units, 1u);

  // Moving a fragment out returns its units.
  ASSERT_TRUE(map_.begin_migration("a", 0, 1.0, 2).has_value());
  ASSERT_TRUE(map_.commit_migration("a").has_value());
  EXPECT_EQ(map_.load(3)->units, 1u);
  EXPECT_TRUE(map_.begin_migration("d", 3, 10.0, 1).has_value());
  ASSERT_TRUE(map_.abort_migration("d").has_value());
  EXPECT_EQ(map_.load(3)->reserved_units, 0u);
}

TEST_F(ResidencyMapTest, ScanAndSnapshot) {
  ASSERT_TRUE(map_.install("c", 1, 10.0).has_value());
  ASSERT_TRUE(map_.install("a", 1, 20.0).has_value());
  ASSERT_TRUE(map_.install("b", 2, 30.0).has_value());
  ASSERT_TRUE(map_.begin_migration("b", 1, 40.0).has_value());

  EXPECT_EQ(map_.scan_for_node(1), (std::vector<FragmentId>{"a", "c"}));
  EXPECT_EQ(map_.scan_for_node(2), (std::vector<FragmentId>{"b"}));
  EXPECT_TRUE(map_.scan_for_node(0).empty());

  auto snap = map_.snapshot();
  ASSERT_EQ(snap.size(), 3u);
  EXPECT_EQ(snap[0].fragment, "a");
  EXPECT_EQ(snap[1].fragment, "b");
  EXPECT_EQ(snap[1].node, 2u);
  EXPECT_EQ(snap[1].migrating_to, std::optional<NodeId>{1});
  EXPECT_DOUBLE_EQ(snap[1].cost, 30.0);
  EXPECT_EQ(map_.size(), 3u);
}

TEST_F(ResidencyMapTest, ConcurrentReadersDuringMigration) {
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(map_.install("f" + std::to_string(i), 0, 1.0).has_value());
  }

  std::thread writer([this] {
    for (int i = 0; i < 50; ++i) {
      auto id = "f" + std::to_string(i);
      if (map_.begin_migration(id, 1, 100.0).has_value()) {
        (void)map_.commit_migration(id);
      }
    }
  });

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([this] {
      for (int i = 0; i < 200; ++i) {
        auto load = map_.load(1);
        ASSERT_TRUE(load.has_value());
        EXPECT_LE(load->resident + load->reserved, 10000.0 + 1e-6);
        for (const auto &rec : map_.snapshot()) {
          EXPECT_TRUE(rec.node == 0 || rec.node == 1);
        }
      }
    });
  }

  writer.join();
  for (auto &t : readers) {
    t.join();
  }
  EXPECT_EQ(map_.load(1)->fragments, 50u);
}

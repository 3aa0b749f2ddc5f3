#include <synod/core/errors.hpp>
#include <synod/sim/world.hpp>

#include <gtest/gtest.h>

#include <map>
#include <sstream>
#include <stdexcept>

using namespace synod;
using namespace synod::sim;

namespace {

WorldConfig MakeConfig(size_t proposers, size_t learners,
                       size_t max_in_flight) {
  WorldConfig config;
  config.acceptors = 3;
  config.proposers = proposers;
  config.learners = learners;
  config.link.delay = DelayDistribution::Constant(5);
  config.coordinator.max_in_flight = max_in_flight;
  config.seed = 5;
  return config;
}

}  // namespace

TEST(Coordinator, AssignsConsecutiveSlots) {
  World world(MakeConfig(1, 1, 1));

  std::map<InstanceId, Value> committed;
  for (auto value : {"a", "b", "c"}) {
    world.Submit(0, value, [&](InstanceId slot, const Outcome& outcome) {
      ASSERT_TRUE(outcome.Decided());
      committed[slot] = *outcome.value;
    });
  }

  auto& coordinator = world.CoordinatorOf(0);
  EXPECT_EQ(coordinator.InFlight(), 1u);
  EXPECT_EQ(coordinator.Queued(), 2u);

  world.RunUntil([&]() { return committed.size() == 3; }, 10'000);

  EXPECT_EQ(committed,
            (std::map<InstanceId, Value>{{1, "a"}, {2, "b"}, {3, "c"}}));
  EXPECT_EQ(coordinator.NextSlot(), 4u);
  EXPECT_TRUE(world.Safety().Safe());
}

TEST(Coordinator, PipelinesUpToWindow) {
  World world(MakeConfig(1, 1, 3));

  size_t done = 0;
  for (int i = 0; i < 5; ++i) {
    world.Submit(0, "v" + std::to_string(i),
                 [&](InstanceId, const Outcome&) { ++done; });
  }

  auto& coordinator = world.CoordinatorOf(0);
  EXPECT_EQ(coordinator.InFlight(), 3u);
  EXPECT_EQ(coordinator.Queued(), 2u);
  EXPECT_EQ(world.Proposer(0).Active(), 3u);

  world.RunUntil([&]() { return done == 5; }, 10'000);
  EXPECT_EQ(done, 5u);
  EXPECT_EQ(coordinator.Decisions().size(), 5u);
}

TEST(Coordinator, ReproposesDisplacedValue) {
  // No learners: the coordinator of P1 does not hear about slot 1
  World world(MakeConfig(2, 0, 1));

  ASSERT_TRUE(world.Propose(1, 1, "other").IsOk());
  ASSERT_TRUE(world.RunUntilDecided(1, 1000));

  std::optional<InstanceId> slot;
  world.Submit(0, "mine", [&](InstanceId decided_slot, const Outcome& outcome) {
    ASSERT_TRUE(outcome.Decided());
    EXPECT_EQ(*outcome.value, "mine");
    slot = decided_slot;
  });

  world.RunUntil([&]() { return slot.has_value(); }, 10'000);

  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(*slot, 2u);

  const auto& decisions = world.CoordinatorOf(0).Decisions();
  EXPECT_EQ(decisions.at(1), "other");
  EXPECT_EQ(decisions.at(2), "mine");
  EXPECT_TRUE(world.Safety().Safe());
}

TEST(Coordinator, SkipsSlotsLearnedElsewhere) {
  World world(MakeConfig(2, 1, 1));

  ASSERT_TRUE(world.Propose(1, 1, "other").IsOk());
  ASSERT_TRUE(world.RunUntilDecided(1, 1000));

  std::optional<InstanceId> slot;
  world.Submit(0, "mine", [&](InstanceId decided_slot, const Outcome&) {
    slot = decided_slot;
  });
  world.RunUntil([&]() { return slot.has_value(); }, 10'000);

  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(*slot, 2u);
  // Slot 1 was never proposed by P1
  EXPECT_EQ(world.Proposer(0).Find(1), nullptr);
}

TEST(Coordinator, ReportsLivenessFailure) {
  auto config = MakeConfig(1, 1, 1);
  config.proposer.max_retries = 1;
  World world(config);

  for (const auto& acceptor : world.Members().acceptors) {
    world.Isolate(acceptor);
  }

  std::optional<Outcome> result;
  world.Submit(0, "lost", [&](InstanceId, const Outcome& outcome) {
    result = outcome;
  });
  world.RunFor(10'000);

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->Decided());
  EXPECT_EQ(result->error, Errc::QuorumUnavailable);
  EXPECT_EQ(world.CoordinatorOf(0).InFlight(), 0u);
  EXPECT_EQ(world.CoordinatorOf(0).Queued(), 0u);
}

TEST(Coordinator, RejectsEmptyWindow) {
  CoordinatorConfig config;
  config.max_in_flight = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

#include <synod/sim/delay.hpp>
#include <synod/sim/simulator.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace synod;
using namespace synod::sim;

TEST(Simulator, RunsEventsInTimeOrder) {
  Simulator simulator(1);
  std::vector<int> order;

  simulator.Schedule(30, [&]() { order.push_back(3); });
  simulator.Schedule(10, [&]() { order.push_back(1); });
  simulator.Schedule(20, [&]() { order.push_back(2); });

  simulator.RunFor(100);
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(simulator.Now(), 100u);
}

TEST(Simulator, SameTimeInSchedulingOrder) {
  Simulator simulator(1);
  std::vector<int> order;

  for (int i = 0; i < 5; ++i) {
    simulator.Schedule(5, [&order, i]() { order.push_back(i); });
  }
  simulator.RunFor(5);
  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(Simulator, ClockAdvancesWithEvents) {
  Simulator simulator(1);
  Millis fired_at = 0;

  simulator.Schedule(15, [&]() {
    fired_at = simulator.Now();
  });
  ASSERT_TRUE(simulator.Step());
  EXPECT_EQ(fired_at, 15u);
  EXPECT_FALSE(simulator.Step());
}

TEST(Simulator, CancelledTimerDoesNotFire) {
  Simulator simulator(1);
  bool fired = false;

  auto id = simulator.Timers()->After(10, [&]() { fired = true; });
  simulator.Timers()->Cancel(id);
  simulator.Timers()->Cancel(id);

  simulator.RunFor(20);
  EXPECT_FALSE(fired);
  EXPECT_EQ(simulator.Pending(), 0u);
}

TEST(Simulator, NestedScheduling) {
  Simulator simulator(1);
  std::vector<Millis> times;

  simulator.Schedule(10, [&]() {
    times.push_back(simulator.Now());
    simulator.Schedule(10, [&]() {
      times.push_back(simulator.Now());
    });
  });

  simulator.RunFor(15);
  EXPECT_EQ(times, (std::vector<Millis>{10}));
  simulator.RunFor(15);
  EXPECT_EQ(times, (std::vector<Millis>{10, 20}));
}

TEST(Simulator, RunUntil) {
  Simulator simulator(1);
  int counter = 0;
  for (int i = 1; i <= 10; ++i) {
    simulator.Schedule(i * 10, [&]() { ++counter; });
  }

  EXPECT_TRUE(simulator.RunUntil([&]() { return counter == 3; }, 1000));
  EXPECT_EQ(simulator.Now(), 30u);

  EXPECT_FALSE(simulator.RunUntil([&]() { return counter == 100; }, 75));
  EXPECT_EQ(counter, 7);
  EXPECT_EQ(simulator.Now(), 75u);
}

TEST(Simulator, SameSeedSameRandomness) {
  Simulator first(42);
  Simulator second(42);
  for (size_t i = 0; i < 100; ++i) {
    auto value = first.RandomNumber(0, 1000);
    EXPECT_EQ(value, second.RandomNumber(0, 1000));
    EXPECT_LE(value, 1000u);
  }
}

TEST(Delay, Samples) {
  std::mt19937_64 random(3);

  auto constant = DelayDistribution::Constant(7);
  EXPECT_EQ(constant.Sample(random), 7u);

  auto uniform = DelayDistribution::Uniform(5, 10);
  auto exponential = DelayDistribution::Exponential(5, 20);
  for (size_t i = 0; i < 1000; ++i) {
    auto delay = uniform.Sample(random);
    EXPECT_GE(delay, 5u);
    EXPECT_LE(delay, 10u);
    EXPECT_LE(exponential.Sample(random), 20u);
  }
}

TEST(Delay, Parse) {
  EXPECT_EQ(ParseDelay("3").Describe(), "const:3");
  EXPECT_EQ(ParseDelay("const:4").Describe(), "const:4");
  EXPECT_EQ(ParseDelay("uniform:1-9").Describe(), "uniform:1-9");
  EXPECT_EQ(ParseDelay("exp:5:50").Describe(), "exp:5:50");

  EXPECT_THROW(ParseDelay("uniform:9-1"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("normal:5"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("exp:5"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("fast"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("-5"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("const:-5"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("exp:-5:100"), std::invalid_argument);
  EXPECT_THROW(ParseDelay("uniform:1- 9"), std::invalid_argument);
}

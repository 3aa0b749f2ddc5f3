#include <synod/core/backoff.hpp>
#include <synod/core/quorum.hpp>

#include <gtest/gtest.h>

using namespace synod;

TEST(Quorum, Majority) {
  EXPECT_EQ(Majority(1), 1u);
  EXPECT_EQ(Majority(3), 2u);
  EXPECT_EQ(Majority(4), 3u);
  EXPECT_EQ(Majority(5), 3u);
}

TEST(Quorum, CountsDistinctVoters) {
  QuorumCollector<int> quorum(2);

  EXPECT_TRUE(quorum.Add("A1", 1));
  EXPECT_FALSE(quorum.Add("A1", 1));
  EXPECT_FALSE(quorum.Reached());

  EXPECT_TRUE(quorum.Add("A2", 2));
  EXPECT_TRUE(quorum.Reached());
  EXPECT_EQ(quorum.Count(), 2u);
  EXPECT_EQ(quorum.Votes().at("A2"), 2);

  quorum.Reset();
  EXPECT_EQ(quorum.Count(), 0u);
  EXPECT_FALSE(quorum.Reached());
}

TEST(Backoff, GrowsUpToMax) {
  Backoff backoff({10, 50, 2});
  EXPECT_EQ(backoff(), 10u);
  EXPECT_EQ(backoff(), 20u);
  EXPECT_EQ(backoff(), 40u);
  EXPECT_EQ(backoff(), 50u);
  EXPECT_EQ(backoff(), 50u);

  backoff.Reset();
  EXPECT_EQ(backoff(), 10u);
}

#include "helpers.hpp"

#include <synod/roles/learner.hpp>
#include <synod/sim/simulator.hpp>

#include <gtest/gtest.h>

using namespace synod;
using namespace synod::test;

class LearnerTest : public ::testing::Test {
 protected:
  sim::Simulator simulator_{1};
  // 5 acceptors
  Learner learner_{1, 3, simulator_.LoggerBackend()};
};

TEST_F(LearnerTest, DecidesOnQuorumOfSameProposal) {
  proto::Accepted vote{Make(1, "X")};

  EXPECT_FALSE(learner_.Observe("A1", vote));
  EXPECT_FALSE(learner_.Observe("A2", vote));

  auto decided = learner_.Observe("A3", vote);
  ASSERT_TRUE(decided.has_value());
  EXPECT_EQ(decided->instance, 1u);
  EXPECT_EQ(decided->value, "X");
  EXPECT_EQ(*learner_.Decision(), "X");
}

TEST_F(LearnerTest, DecidedExactlyOnce) {
  proto::Accepted vote{Make(1, "X")};
  learner_.Observe("A1", vote);
  learner_.Observe("A2", vote);
  ASSERT_TRUE(learner_.Observe("A3", vote));

  EXPECT_FALSE(learner_.Observe("A4", vote));
  EXPECT_FALSE(learner_.Observe("A5", vote));
  EXPECT_FALSE(learner_.Observe(proto::Decided{1, "X"}));
  EXPECT_EQ(learner_.Conflicts(), 0u);
}

TEST_F(LearnerTest, DuplicateVotesAreNotCounted) {
  proto::Accepted vote{Make(1, "X")};
  learner_.Observe("A1", vote);
  learner_.Observe("A1", vote);
  learner_.Observe("A2", vote);
  EXPECT_FALSE(learner_.Decision().has_value());
  EXPECT_EQ(learner_.Votes(), 2u);
}

TEST_F(LearnerTest, VotesOfDifferentProposalsAreNotMixed) {
  learner_.Observe("A1", {Make(1, "X")});
  learner_.Observe("A2", {Make(1, "X")});
  learner_.Observe("A3", {Make(2, "X", "P2")});
  EXPECT_FALSE(learner_.Decision().has_value());

  learner_.Observe("A4", {Make(2, "X", "P2")});
  auto decided = learner_.Observe("A5", {Make(2, "X", "P2")});
  ASSERT_TRUE(decided.has_value());
  EXPECT_EQ(decided->value, "X");
}

TEST_F(LearnerTest, AnnouncementShortCircuits) {
  learner_.Observe("A1", {Make(1, "X")});

  auto decided = learner_.Observe(proto::Decided{1, "X"});
  ASSERT_TRUE(decided.has_value());
  EXPECT_EQ(*learner_.Decision(), "X");
}

TEST_F(LearnerTest, ConflictingAnnouncementIsCounted) {
  ASSERT_TRUE(learner_.Observe(proto::Decided{1, "X"}));
  EXPECT_FALSE(learner_.Observe(proto::Decided{1, "Y"}));
  EXPECT_EQ(*learner_.Decision(), "X");
  EXPECT_EQ(learner_.Conflicts(), 1u);
}

TEST_F(LearnerTest, DropsVotesOnceDecided) {
  learner_.Observe("A1", {Make(1, "X")});
  learner_.Observe("A2", {Make(2, "Y", "P2")});
  EXPECT_EQ(learner_.Groups(), 2u);

  learner_.Observe("A3", {Make(1, "X")});
  ASSERT_TRUE(learner_.Observe("A4", {Make(1, "X")}));
  EXPECT_EQ(learner_.Groups(), 0u);

  // Late votes are not tracked again
  EXPECT_FALSE(learner_.Observe("A5", {Make(1, "X")}));
  EXPECT_FALSE(learner_.Observe("A3", {Make(2, "Y", "P2")}));
  EXPECT_EQ(learner_.Groups(), 0u);
  EXPECT_EQ(learner_.Votes(), 4u);
  EXPECT_EQ(*learner_.Decision(), "X");
}

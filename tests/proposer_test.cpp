#include "helpers.hpp"

#include <synod/core/errors.hpp>
#include <synod/metrics/event_log.hpp>
#include <synod/roles/proposer.hpp>
#include <synod/sim/simulator.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>

using namespace synod;
using namespace synod::test;

class ProposerTest : public ::testing::Test {
 protected:
  ProposerTest() {
    config_.round_deadline = 50;
    config_.max_retries = 3;
    config_.backoff = {10, 100, 2};
    config_.jitter = false;
  }

  std::unique_ptr<Proposer> MakeProposer(Value candidate = "mine") {
    Context context{"P1", &simulator_, &messenger_, &events_};
    Membership membership{{"A1", "A2", "A3"}, {"L1"}};
    return std::make_unique<Proposer>(context, 1, membership, config_,
                                      std::move(candidate),
                                      [this](const Outcome& outcome) {
                                        outcome_ = outcome;
                                        ++callbacks_;
                                      });
  }

  static proto::Message Promise(const ProposalId& id,
                                std::optional<Proposal> vote = {}) {
    return proto::Promise{id, std::move(vote)};
  }

  static proto::Message Accepted(const Proposal& proposal) {
    return proto::Accepted{proposal};
  }

  static proto::Message Nack(const ProposalId& id, const ProposalId& advice) {
    return proto::Nack{id, advice, proto::NackReason::PrepareRejected};
  }

  sim::Simulator simulator_{7};
  CapturingMessenger messenger_;
  EventLog events_;
  ProposerConfig config_;

  std::optional<Outcome> outcome_;
  size_t callbacks_{0};
};

TEST_F(ProposerTest, BroadcastsPrepare) {
  auto proposer = MakeProposer();
  proposer->Start();

  auto prepares = messenger_.OfKind<proto::Prepare>();
  ASSERT_EQ(prepares.size(), 3u);
  for (const auto& envelope : prepares) {
    EXPECT_EQ(envelope.from, "P1");
    EXPECT_EQ(envelope.instance, 1u);
    EXPECT_EQ(std::get<proto::Prepare>(envelope.message).id, Id(1));
  }
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Preparing);
  EXPECT_EQ(events_.Count(EventType::PrepareSent), 3u);
}

TEST_F(ProposerTest, ProposesOwnValueWithoutPriorVotes) {
  auto proposer = MakeProposer("X");
  proposer->Start();

  proposer->Handle("A1", Promise(Id(1)));
  EXPECT_EQ(messenger_.Count<proto::Accept>(), 0u);
  proposer->Handle("A2", Promise(Id(1)));

  auto accepts = messenger_.OfKind<proto::Accept>();
  ASSERT_EQ(accepts.size(), 3u);
  EXPECT_EQ(std::get<proto::Accept>(accepts[0].message).proposal, Make(1, "X"));
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Accepting);
}

TEST_F(ProposerTest, AdoptsHighestPriorVote) {
  auto proposer = MakeProposer("mine");
  proposer->Start();

  proposer->Handle("A1", Promise(Id(1), Make(0, "old", "P3")));
  proposer->Handle("A2", Promise(Id(1), Make(0, "newer", "P4")));

  auto accepts = messenger_.OfKind<proto::Accept>();
  ASSERT_EQ(accepts.size(), 3u);
  EXPECT_EQ(std::get<proto::Accept>(accepts[0].message).proposal.value,
            "newer");
}

TEST_F(ProposerTest, DuplicatePromiseIsNotAQuorum) {
  auto proposer = MakeProposer();
  proposer->Start();

  proposer->Handle("A1", Promise(Id(1)));
  proposer->Handle("A1", Promise(Id(1)));

  EXPECT_EQ(messenger_.Count<proto::Accept>(), 0u);
}

TEST_F(ProposerTest, DecidesOnQuorumOfAccepted) {
  auto proposer = MakeProposer("X");
  proposer->Start();
  proposer->Handle("A1", Promise(Id(1)));
  proposer->Handle("A2", Promise(Id(1)));

  proposer->Handle("A1", Accepted(Make(1, "X")));
  EXPECT_FALSE(outcome_.has_value());
  proposer->Handle("A3", Accepted(Make(1, "X")));

  ASSERT_TRUE(outcome_.has_value());
  EXPECT_TRUE(outcome_->Decided());
  EXPECT_EQ(*outcome_->value, "X");
  EXPECT_FALSE(outcome_->error);
  EXPECT_EQ(outcome_->rounds, 1u);
  EXPECT_EQ(outcome_->retries, 0u);
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Decided);

  // Learners are notified
  auto decided = messenger_.OfKind<proto::Decided>();
  ASSERT_EQ(decided.size(), 1u);
  EXPECT_EQ(decided[0].to, "L1");

  // Late votes change nothing
  proposer->Handle("A2", Accepted(Make(1, "X")));
  EXPECT_EQ(callbacks_, 1u);
}

TEST_F(ProposerTest, StaleRepliesAreDiscarded) {
  auto proposer = MakeProposer();
  proposer->Start();

  // Promise for another round
  proposer->Handle("A1", Promise(Id(7)));
  proposer->Handle("A2", Promise(Id(7)));
  EXPECT_EQ(messenger_.Count<proto::Accept>(), 0u);

  // Accepted before Accept phase
  proposer->Handle("A1", Accepted(Make(1, "mine")));
  proposer->Handle("A2", Accepted(Make(1, "mine")));
  EXPECT_FALSE(outcome_.has_value());

  // Nack for another round
  proposer->Handle("A3", Nack(Id(0), Id(9)));
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Preparing);
}

TEST_F(ProposerTest, NackTriggersRetryAboveAdvice) {
  auto proposer = MakeProposer();
  proposer->Start();

  proposer->Handle("A1", Nack(Id(1), Id(5, "P2")));
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Backoff);
  EXPECT_EQ(events_.Count(EventType::NackRecv), 1u);
  EXPECT_EQ(events_.Count(EventType::Retry), 1u);

  messenger_.Clear();
  simulator_.RunFor(10);

  auto prepares = messenger_.OfKind<proto::Prepare>();
  ASSERT_EQ(prepares.size(), 3u);
  EXPECT_EQ(std::get<proto::Prepare>(prepares[0].message).id, Id(6));
  EXPECT_EQ(proposer->Retries(), 1u);
  EXPECT_EQ(proposer->Rounds(), 2u);
}

TEST_F(ProposerTest, NackOfOwnDuplicatePrepareIsIgnored) {
  auto proposer = MakeProposer();
  proposer->Start();

  proposer->Handle("A1", Nack(Id(1), Id(1)));
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Preparing);
}

TEST_F(ProposerTest, DeadlineTriggersRetry) {
  auto proposer = MakeProposer();
  proposer->Start();
  proposer->Handle("A1", Promise(Id(1)));

  simulator_.RunFor(49);
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Preparing);

  simulator_.RunFor(1);
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Backoff);
  EXPECT_EQ(events_.Count(EventType::Timeout), 1u);

  // Promise of the abandoned round arrives late
  proposer->Handle("A2", Promise(Id(1)));
  EXPECT_EQ(messenger_.Count<proto::Accept>(), 0u);

  simulator_.RunFor(10);
  EXPECT_EQ(proposer->CurrentId(), Id(2));
}

TEST_F(ProposerTest, BackoffGrows) {
  auto proposer = MakeProposer();
  proposer->Start();

  // Rounds start at 0, 50 + 10, 110 + 20 = 130, 180 + 40 = 220
  simulator_.RunFor(50 + 10);
  EXPECT_EQ(proposer->CurrentId().round, 2u);
  simulator_.RunFor(50 + 20);
  EXPECT_EQ(proposer->CurrentId().round, 3u);
  simulator_.RunFor(50 + 40);
  EXPECT_EQ(proposer->CurrentId().round, 4u);
}

TEST_F(ProposerTest, GivesUpAfterMaxRetries) {
  auto proposer = MakeProposer();
  proposer->Start();

  simulator_.RunFor(10'000);

  ASSERT_TRUE(outcome_.has_value());
  EXPECT_FALSE(outcome_->Decided());
  EXPECT_EQ(outcome_->error, Errc::QuorumUnavailable);
  EXPECT_EQ(outcome_->retries, 3u);
  EXPECT_EQ(outcome_->rounds, 4u);
  EXPECT_EQ(callbacks_, 1u);
  EXPECT_EQ(proposer->Phase(), ProposerPhase::Failed);
  EXPECT_EQ(events_.Count(EventType::LivenessFailure), 1u);
  EXPECT_EQ(simulator_.Pending(), 0u);
}

TEST_F(ProposerTest, DestructionCancelsTimers) {
  {
    auto proposer = MakeProposer();
    proposer->Start();
  }
  EXPECT_EQ(simulator_.Pending(), 0u);
}

TEST(ProposerConfig, Validate) {
  ProposerConfig config;
  EXPECT_NO_THROW(config.Validate());

  config.round_deadline = 0;
  EXPECT_THROW(config.Validate(), std::invalid_argument);

  config = {};
  config.backoff = {100, 10, 2};
  EXPECT_THROW(config.Validate(), std::invalid_argument);
}

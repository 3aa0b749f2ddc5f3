#include "helpers.hpp"

#include <synod/core/errors.hpp>
#include <synod/roles/acceptor.hpp>
#include <synod/sim/simulator.hpp>
#include <synod/store/memory_store.hpp>

#include <gtest/gtest.h>

#include <random>

using namespace synod;
using namespace synod::test;

class AcceptorTest : public ::testing::Test {
 protected:
  Acceptor MakeAcceptor(InstanceId instance = 1) {
    return Acceptor(instance, store_, simulator_.LoggerBackend());
  }

  sim::Simulator simulator_{1};
  MemoryAcceptorStore store_;
};

TEST_F(AcceptorTest, FirstPrepareIsPromised) {
  auto acceptor = MakeAcceptor();

  auto reply = acceptor.Prepare({Id(1)});
  ASSERT_TRUE(reply.IsOk());

  const auto* promise = std::get_if<proto::Promise>(&*reply);
  ASSERT_NE(promise, nullptr);
  EXPECT_EQ(promise->id, Id(1));
  EXPECT_FALSE(promise->vote.has_value());
  EXPECT_EQ(*acceptor.State().promised, Id(1));
}

TEST_F(AcceptorTest, LowerOrEqualPrepareIsRejected) {
  auto acceptor = MakeAcceptor();
  ASSERT_TRUE(acceptor.Prepare({Id(5, "P2")}).IsOk());

  for (auto id : {Id(5, "P2"), Id(5, "P1"), Id(4, "P9")}) {
    auto reply = acceptor.Prepare({id});
    ASSERT_TRUE(reply.IsOk());

    const auto* nack = std::get_if<proto::Nack>(&*reply);
    ASSERT_NE(nack, nullptr);
    EXPECT_EQ(nack->id, id);
    EXPECT_EQ(nack->advice, Id(5, "P2"));
    EXPECT_EQ(nack->reason, proto::NackReason::PrepareRejected);
  }

  EXPECT_EQ(*acceptor.State().promised, Id(5, "P2"));
}

TEST_F(AcceptorTest, PromiseCarriesAcceptedProposal) {
  auto acceptor = MakeAcceptor();
  ASSERT_TRUE(acceptor.Prepare({Id(1)}).IsOk());
  ASSERT_TRUE(acceptor.Accept({Make(1, "X")}).IsOk());

  auto reply = acceptor.Prepare({Id(2, "P2")});
  const auto* promise = std::get_if<proto::Promise>(&*reply);
  ASSERT_NE(promise, nullptr);
  ASSERT_TRUE(promise->vote.has_value());
  EXPECT_EQ(*promise->vote, Make(1, "X"));
}

TEST_F(AcceptorTest, AcceptAtOrAbovePromise) {
  auto acceptor = MakeAcceptor();
  ASSERT_TRUE(acceptor.Prepare({Id(3)}).IsOk());

  auto equal = acceptor.Accept({Make(3, "X")});
  EXPECT_TRUE(std::holds_alternative<proto::Accepted>(*equal));

  // Accept without a prior Prepare of the same id
  auto higher = acceptor.Accept({Make(4, "Y", "P2")});
  ASSERT_TRUE(std::holds_alternative<proto::Accepted>(*higher));
  EXPECT_EQ(std::get<proto::Accepted>(*higher).proposal, Make(4, "Y", "P2"));

  EXPECT_EQ(*acceptor.State().promised, Id(4, "P2"));
  EXPECT_EQ(*acceptor.State().accepted, Make(4, "Y", "P2"));
}

TEST_F(AcceptorTest, AcceptBelowPromiseIsRejected) {
  auto acceptor = MakeAcceptor();
  ASSERT_TRUE(acceptor.Prepare({Id(3)}).IsOk());

  auto reply = acceptor.Accept({Make(2, "X")});
  const auto* nack = std::get_if<proto::Nack>(&*reply);
  ASSERT_NE(nack, nullptr);
  EXPECT_EQ(nack->reason, proto::NackReason::AcceptRejected);
  EXPECT_EQ(nack->advice, Id(3));
  EXPECT_FALSE(acceptor.State().accepted.has_value());
}

TEST_F(AcceptorTest, StateIsPersistedBeforeReply) {
  {
    auto acceptor = MakeAcceptor();
    ASSERT_TRUE(acceptor.Prepare({Id(2)}).IsOk());
    ASSERT_TRUE(acceptor.Accept({Make(2, "X")}).IsOk());
  }

  // Restarted acceptor resumes from the store
  auto restarted = MakeAcceptor();
  EXPECT_EQ(*restarted.State().promised, Id(2));
  EXPECT_EQ(*restarted.State().accepted, Make(2, "X"));

  auto reply = restarted.Prepare({Id(1)});
  EXPECT_TRUE(std::holds_alternative<proto::Nack>(*reply));
}

TEST_F(AcceptorTest, InstancesAreIndependent) {
  auto first = MakeAcceptor(1);
  auto second = MakeAcceptor(2);

  ASSERT_TRUE(first.Prepare({Id(7)}).IsOk());
  auto reply = second.Prepare({Id(1)});
  EXPECT_TRUE(std::holds_alternative<proto::Promise>(*reply));
}

TEST_F(AcceptorTest, StopsAnsweringAfterPersistenceFailure) {
  auto acceptor = MakeAcceptor();
  store_.FailAfter(1);

  ASSERT_TRUE(acceptor.Prepare({Id(1)}).IsOk());

  auto failed = acceptor.Accept({Make(1, "X")});
  ASSERT_TRUE(failed.HasError());
  EXPECT_EQ(failed.GetErrorCode(), Errc::PersistenceFailure);
  EXPECT_TRUE(acceptor.Failed());

  // Volatile state was not updated
  EXPECT_FALSE(acceptor.State().accepted.has_value());

  // Even requests that need no write are refused
  store_.Heal();
  EXPECT_TRUE(acceptor.Prepare({Id(0)}).HasError());
  EXPECT_TRUE(acceptor.Accept({Make(9, "Y")}).HasError());
}

TEST_F(AcceptorTest, PromisedIdNeverDecreases) {
  auto acceptor = MakeAcceptor();

  std::mt19937_64 random(17);
  std::uniform_int_distribution<uint64_t> round(0, 20);
  std::uniform_int_distribution<int> coin(0, 1);

  ProposalId last = ProposalId::Zero();

  for (size_t i = 0; i < 500; ++i) {
    ProposalId id{round(random), coin(random) ? "P1" : "P2"};
    if (coin(random)) {
      ASSERT_TRUE(acceptor.Prepare({id}).IsOk());
    } else {
      ASSERT_TRUE(acceptor.Accept({Proposal{id, "v"}}).IsOk());
    }

    const auto& state = acceptor.State();
    if (state.promised) {
      EXPECT_GE(*state.promised, last);
      last = *state.promised;
      if (state.accepted) {
        EXPECT_LE(state.accepted->id, *state.promised);
      }
    }
  }
}

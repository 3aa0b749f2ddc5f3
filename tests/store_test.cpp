#include <synod/core/errors.hpp>
#include <synod/store/memory_store.hpp>

#include <gtest/gtest.h>

using namespace synod;

TEST(MemoryStore, EmptyInstance) {
  MemoryAcceptorStore store;
  EXPECT_FALSE(store.Load(1).has_value());
}

TEST(MemoryStore, KeepsStatePerInstance) {
  MemoryAcceptorStore store;

  AcceptorState state;
  state.promised = ProposalId{3, "P2"};
  state.accepted = Proposal{{2, "P1"}, "X"};

  ASSERT_TRUE(store.Save(1, state).IsOk());

  auto loaded = store.Load(1);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded->promised, (ProposalId{3, "P2"}));
  EXPECT_EQ(*loaded->accepted, (Proposal{{2, "P1"}, "X"}));

  EXPECT_FALSE(store.Load(2).has_value());
}

TEST(MemoryStore, FailAfter) {
  MemoryAcceptorStore store;
  store.FailAfter(1);

  AcceptorState state;
  state.promised = ProposalId{1, "P1"};
  EXPECT_TRUE(store.Save(1, state).IsOk());

  state.promised = ProposalId{2, "P1"};
  auto status = store.Save(1, state);
  ASSERT_TRUE(status.HasError());
  EXPECT_EQ(status.GetErrorCode(), Errc::PersistenceFailure);

  // Failed write leaves the last durable state
  EXPECT_EQ(*store.Load(1)->promised, (ProposalId{1, "P1"}));
  EXPECT_EQ(store.Writes(), 1u);
  EXPECT_EQ(store.FailedWrites(), 1u);

  store.Heal();
  EXPECT_TRUE(store.Save(1, state).IsOk());
}

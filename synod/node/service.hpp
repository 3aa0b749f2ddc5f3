#pragma once

#include <synod/actors/acceptor_actor.hpp>
#include <synod/actors/learner_actor.hpp>
#include <synod/actors/proposer_actor.hpp>
#include <synod/coordinator/coordinator.hpp>
#include <synod/metrics/event_log.hpp>
#include <synod/node/kv_store.hpp>
#include <synod/node/rpc_messenger.hpp>
#include <synod/node/runtime.hpp>

#include <await/fibers/sync/mutex.hpp>

#include <commute/rpc/service_base.hpp>

#include <timber/logger.hpp>

#include <memory>

namespace synod::node {

// Reads proposer knobs from the node config (synod.* keys)
ProposerConfig ProposerConfigFromNodeConfig();

// Acceptor, proposer and learner of one node behind RPC service "Synod"
// All actor code runs under one fiber mutex

class Synod : public commute::rpc::ServiceBase<Synod> {
 public:
  Synod();

 protected:
  // Message from another node
  bool Deliver(proto::Envelope envelope);

  // Single-decree consensus on instance 1, returns the chosen value
  Value Propose(Value value);

  // Appends value to the sequence of slots, returns its slot
  InstanceId Append(Value value);

  void RegisterMethods() override;

 private:
  Membership MakeMembership() const;
  Context MakeContext();

  void Route(const proto::Envelope& envelope);

 private:
  await::fibers::Mutex mutex_;
  NodeRuntime runtime_;
  RpcMessenger messenger_;
  KVAcceptorStore store_;
  LoggingEventSink events_;
  timber::Logger logger_;

  std::unique_ptr<AcceptorActor> acceptor_;
  std::unique_ptr<ProposerActor> proposer_;
  std::unique_ptr<LearnerActor> learner_;
  std::unique_ptr<Coordinator> coordinator_;
};

}  // namespace synod::node

#pragma once

#include <synod/metrics/snapshot.hpp>
#include <synod/net/messenger.hpp>
#include <synod/roles/acceptor.hpp>
#include <synod/roles/context.hpp>

#include <timber/logger.hpp>

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace synod {

// Hosts one acceptor per instance, handles Prepare / Accept one at a time

class AcceptorActor : public IEndpoint, public ISnapshotSource {
 public:
  // Every vote cast by this acceptor, after it was persisted
  using VoteObserver = std::function<void(
      InstanceId instance, const NodeId& acceptor, const Proposal& vote)>;

 public:
  AcceptorActor(Context context, IAcceptorStore& store,
                std::vector<NodeId> learners);

  const NodeId& Id() const {
    return context_.self;
  }

  void Handle(const proto::Envelope& envelope) override;

  void SetVoteObserver(VoteObserver observer) {
    vote_observer_ = std::move(observer);
  }

  // Discards volatile state, messages are ignored until Recover
  void Crash();
  // Acceptors reload their state from the store on next message
  void Recover();

  bool Crashed() const {
    return crashed_;
  }

  // Instance stopped answering after a persistence failure
  bool Failed(InstanceId instance) const {
    return failed_.contains(instance);
  }

  // nullptr if instance was never touched since last recovery
  const Acceptor* Find(InstanceId instance) const;

  NodeSnapshot Snapshot() const override;

 private:
  Acceptor& GetOrCreate(InstanceId instance);

  void OnPrepare(const proto::Envelope& request,
                 const proto::Prepare& prepare);
  void OnAccept(const proto::Envelope& request, const proto::Accept& accept);
  void OnPersistFailure(InstanceId instance);

  void Send(const NodeId& to, InstanceId instance, proto::Message message,
            EventType event);
  void Emit(InstanceId instance, EventType type, const NodeId& peer,
            std::string detail = {});

 private:
  timber::Logger logger_;
  const Context context_;
  IAcceptorStore& store_;
  const std::vector<NodeId> learners_;
  VoteObserver vote_observer_;

  std::map<InstanceId, std::unique_ptr<Acceptor>> acceptors_;
  std::set<InstanceId> failed_;
  bool crashed_{false};

  // For snapshots
  InstanceId last_instance_{0};
  std::string last_message_type_;
};

}  // namespace synod

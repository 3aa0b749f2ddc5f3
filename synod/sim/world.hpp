#pragma once

#include <synod/actors/acceptor_actor.hpp>
#include <synod/actors/learner_actor.hpp>
#include <synod/actors/proposer_actor.hpp>
#include <synod/coordinator/coordinator.hpp>
#include <synod/metrics/event_log.hpp>
#include <synod/sim/network.hpp>
#include <synod/sim/safety_monitor.hpp>
#include <synod/sim/simulator.hpp>
#include <synod/store/memory_store.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace synod::sim {

struct WorldConfig {
  size_t acceptors{3};
  size_t proposers{1};
  size_t learners{1};

  ProposerConfig proposer;
  CoordinatorConfig coordinator;
  LinkConfig link;

  uint64_t seed{0};
  timber::Level log_level{timber::Level::Warning};

  // Throws std::invalid_argument
  void Validate() const;
};

// Acceptors "A1".."An", proposers "P1".."Pn", learners "L1".."Ln"
// on one simulator and network

class World {
 public:
  explicit World(WorldConfig config, std::ostream& log = std::cerr);

  World(const World&) = delete;
  World& operator=(const World&) = delete;

  Simulator& Sim() {
    return simulator_;
  }

  Network& Net() {
    return *network_;
  }

  EventLog& Events() {
    return events_;
  }

  const SafetyMonitor& Safety() const {
    return *safety_;
  }

  const WorldConfig& Config() const {
    return config_;
  }

  // Actors, indices are 0-based

  AcceptorActor& Acceptor(size_t index) {
    return *acceptors_.at(index);
  }

  ProposerActor& Proposer(size_t index) {
    return *proposers_.at(index);
  }

  LearnerActor& Learner(size_t index) {
    return *learners_.at(index);
  }

  Coordinator& CoordinatorOf(size_t proposer) {
    return *coordinators_.at(proposer);
  }

  MemoryAcceptorStore& Store(size_t acceptor) {
    return *stores_.at(acceptor);
  }

  const Membership& Members() const {
    return membership_;
  }

  std::vector<NodeId> ProposerIds() const;

  // Clients

  wheels::Status Propose(size_t proposer, InstanceId instance, Value value,
                         OutcomeCallback callback = {});

  // Slot assigned by the proposer's coordinator
  void Submit(size_t proposer, Value value,
              Coordinator::SubmitCallback callback = {});

  // Terminal outcome of a Propose call, if already known
  std::optional<Outcome> OutcomeOf(size_t proposer, InstanceId instance) const;

  // First decision reported by a learner or a proposer
  std::optional<Value> Decision(InstanceId instance) const;

  // Faults

  void Crash(size_t acceptor);
  void Recover(size_t acceptor);
  void Isolate(const NodeId& node);
  void Rejoin(const NodeId& node);
  void Block(const NodeId& from, const NodeId& to);
  void Unblock(const NodeId& from, const NodeId& to);

  // Execution

  void RunFor(Millis duration);
  bool RunUntil(const std::function<bool()>& predicate, Millis deadline);
  bool RunUntilDecided(InstanceId instance, Millis deadline);

  // Snapshots of all actors in a stable order
  std::vector<const ISnapshotSource*> SnapshotSources() const;
  std::vector<NodeSnapshot> Snapshots() const;

 private:
  Context MakeContext(const NodeId& self);
  void OnLearned(const NodeId& learner, InstanceId instance,
                 const Value& value);

 private:
  const WorldConfig config_;

  Simulator simulator_;
  timber::Logger logger_;
  EventLog events_;
  std::unique_ptr<Network> network_;
  std::unique_ptr<SafetyMonitor> safety_;
  Membership membership_;

  std::vector<std::unique_ptr<MemoryAcceptorStore>> stores_;
  std::vector<std::unique_ptr<AcceptorActor>> acceptors_;
  std::vector<std::unique_ptr<LearnerActor>> learners_;
  std::vector<std::unique_ptr<ProposerActor>> proposers_;
  std::vector<std::unique_ptr<Coordinator>> coordinators_;

  std::map<std::pair<size_t, InstanceId>, Outcome> outcomes_;
  std::map<InstanceId, Value> decisions_;
};

}  // namespace synod::sim

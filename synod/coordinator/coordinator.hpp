#pragma once

#include <synod/actors/proposer_actor.hpp>

#include <timber/logger.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <map>

namespace synod {

struct CoordinatorConfig {
  // Slots proposed concurrently, 1 disables pipelining
  size_t max_in_flight{1};
  InstanceId first_slot{1};
  // Propose a value again if another value won its slot
  bool repropose_displaced{true};

  // Throws std::invalid_argument
  void Validate() const;
};

// Assigns slots to submitted values and drives them through one proposer

class Coordinator {
 public:
  // Decided slot of the value, or the liveness failure
  using SubmitCallback =
      std::function<void(InstanceId slot, const Outcome& outcome)>;

 public:
  Coordinator(ProposerActor& proposer, CoordinatorConfig config,
              timber::ILogBackend* log);

  void Submit(Value value, SubmitCallback callback);

  // Decision learned from elsewhere, the slot is not proposed again
  void ObserveDecision(InstanceId slot, const Value& value);

  InstanceId NextSlot() const {
    return next_slot_;
  }

  size_t InFlight() const {
    return in_flight_.size();
  }

  size_t Queued() const {
    return queue_.size();
  }

  // Slot -> decided value, as known to this coordinator
  const std::map<InstanceId, Value>& Decisions() const {
    return decisions_;
  }

 private:
  struct Request {
    Value value;
    SubmitCallback callback;
    size_t attempts{0};
  };

  void Pump();
  InstanceId AllocateSlot();
  void OnOutcome(InstanceId slot, const Outcome& outcome);

 private:
  timber::Logger logger_;
  ProposerActor& proposer_;
  const CoordinatorConfig config_;

  InstanceId next_slot_;
  std::deque<Request> queue_;
  std::map<InstanceId, Request> in_flight_;
  std::map<InstanceId, Value> decisions_;
};

}  // namespace synod

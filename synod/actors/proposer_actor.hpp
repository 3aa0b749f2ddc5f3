#pragma once

#include <synod/metrics/snapshot.hpp>
#include <synod/net/messenger.hpp>
#include <synod/roles/proposer.hpp>

#include <timber/logger.hpp>

#include <wheels/support/result.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace synod {

// Hosts at most one active proposer per instance and routes replies to it

class ProposerActor : public IEndpoint, public ISnapshotSource {
 public:
  // What remains of a terminal proposer
  struct Record {
    Outcome outcome;
    ProposalId last_id;
    // Next proposer of the instance starts above it
    uint64_t highest_round{0};
  };

 public:
  ProposerActor(Context context, Membership membership,
                ProposerConfig config);

  // Cancels pending disposal of terminal proposers
  ~ProposerActor();

  const NodeId& Id() const {
    return context_.self;
  }

  // Fails with Errc::Busy if instance already has an active proposer
  // Callback is invoked once with the terminal outcome
  wheels::Status Propose(InstanceId instance, Value value,
                         OutcomeCallback callback);

  void Handle(const proto::Envelope& envelope) override;

  // Active proposer for instance
  const Proposer* Find(InstanceId instance) const;

  // Latest terminal outcome for instance
  const Record* Last(InstanceId instance) const;

  size_t Active() const {
    return active_.size();
  }

  // Terminal proposers not yet destroyed
  size_t Finished() const {
    return finished_.size();
  }

  const ProposerConfig& Config() const {
    return config_;
  }

  NodeSnapshot Snapshot() const override;

 private:
  void Retire(InstanceId instance, const Outcome& outcome);
  void DisposeFinished();

 private:
  timber::Logger logger_;
  const Context context_;
  const Membership membership_;
  const ProposerConfig config_;

  std::map<InstanceId, std::unique_ptr<Proposer>> active_;
  std::map<InstanceId, Record> records_;

  // Terminal proposers report from inside themselves,
  // they are destroyed on the next timer tick
  std::vector<std::unique_ptr<Proposer>> finished_;
  std::optional<TimerId> disposal_;

  InstanceId last_instance_{0};
  std::string last_message_type_;
};

}  // namespace synod

#pragma once

#include <synod/metrics/snapshot.hpp>
#include <synod/net/messenger.hpp>
#include <synod/roles/context.hpp>
#include <synod/roles/learner.hpp>

#include <timber/logger.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace synod {

class LearnerActor : public IEndpoint, public ISnapshotSource {
 public:
  using DecisionCallback =
      std::function<void(InstanceId instance, const Value& value)>;

 public:
  // quorum = majority of acceptors
  LearnerActor(Context context, size_t quorum);

  const NodeId& Id() const {
    return context_.self;
  }

  // Invoked once per instance, on the first decision
  void OnDecision(DecisionCallback callback) {
    callback_ = std::move(callback);
  }

  void Handle(const proto::Envelope& envelope) override;

  std::optional<Value> Decision(InstanceId instance) const;

  // Total over all instances
  size_t Conflicts() const;

  NodeSnapshot Snapshot() const override;

 private:
  Learner& GetOrCreate(InstanceId instance);
  void Report(const proto::Decided& decided, const NodeId& from);

 private:
  timber::Logger logger_;
  const Context context_;
  const size_t quorum_;
  DecisionCallback callback_;

  std::map<InstanceId, std::unique_ptr<Learner>> learners_;

  InstanceId last_instance_{0};
  std::string last_message_type_;
};

}  // namespace synod

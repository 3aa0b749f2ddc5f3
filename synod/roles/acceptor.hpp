#pragma once

#include <synod/core/proto.hpp>
#include <synod/roles/acceptor_state.hpp>
#include <synod/store/acceptor_store.hpp>

#include <timber/logger.hpp>

#include <wheels/support/result.hpp>

namespace synod {

// Voting state machine of one acceptor in one instance
// Owns its state exclusively, requests must be serialized by the caller

class Acceptor {
 public:
  Acceptor(InstanceId instance, IAcceptorStore& store,
           timber::ILogBackend* log);

  // Phase 1 (Prepare / Promise)

  // Promise or Nack, error if state could not be persisted
  wheels::Result<proto::Message> Prepare(const proto::Prepare& request);

  // Phase 2 (Accept / Accepted)

  // Accepted or Nack, error if state could not be persisted
  wheels::Result<proto::Message> Accept(const proto::Accept& request);

  const AcceptorState& State() const {
    return state_;
  }

  // Stopped answering after a persistence failure
  bool Failed() const {
    return failed_;
  }

  InstanceId Instance() const {
    return instance_;
  }

 private:
  AcceptorState LoadState() const;
  wheels::Status Persist(AcceptorState next);

  bool PromisedAtLeast(const ProposalId& id) const;

  proto::Message Reject(const ProposalId& id, proto::NackReason reason) const;
  proto::Message Promise() const;
  proto::Message Vote() const;

 private:
  mutable timber::Logger logger_;
  const InstanceId instance_;
  IAcceptorStore& store_;
  AcceptorState state_;
  bool failed_{false};
};

}  // namespace synod

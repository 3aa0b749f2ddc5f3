#include <synod/roles/acceptor.hpp>

#include <synod/core/errors.hpp>

#include <timber/log.hpp>

namespace synod {

using namespace proto;

Acceptor::Acceptor(InstanceId instance, IAcceptorStore& store,
                   timber::ILogBackend* log)
    : logger_("Synod.Acceptor", log),
      instance_(instance),
      store_(store),
      state_(LoadState()) {
}

wheels::Result<Message> Acceptor::Prepare(const proto::Prepare& request) {
  if (failed_) {
    return wheels::make_result::Fail(PersistenceFailure());
  }

  if (PromisedAtLeast(request.id)) {
    LOG_INFO("#{} nack P{}", instance_, request.id);
    return wheels::make_result::Ok(
        Reject(request.id, NackReason::PrepareRejected));
  }

  AcceptorState next = state_;
  next.promised = request.id;

  if (auto status = Persist(std::move(next)); status.HasError()) {
    return wheels::make_result::Fail(status.GetErrorCode());
  }

  LOG_INFO("#{} ack P{}", instance_, request.id);
  return wheels::make_result::Ok(Promise());
}

wheels::Result<Message> Acceptor::Accept(const proto::Accept& request) {
  if (failed_) {
    return wheels::make_result::Fail(PersistenceFailure());
  }

  const auto& proposal = request.proposal;

  if (state_.promised && proposal.id < *state_.promised) {
    LOG_INFO("#{} nack A{}", instance_, proposal);
    return wheels::make_result::Ok(
        Reject(proposal.id, NackReason::AcceptRejected));
  }

  AcceptorState next = state_;
  next.promised = proposal.id;
  next.accepted = proposal;

  if (auto status = Persist(std::move(next)); status.HasError()) {
    return wheels::make_result::Fail(status.GetErrorCode());
  }

  LOG_INFO("#{} ack A{}", instance_, proposal);
  return wheels::make_result::Ok(Vote());
}

AcceptorState Acceptor::LoadState() const {
  return store_.Load(instance_).value_or(AcceptorState::Empty());
}

// State is replaced only after the store has made it durable
wheels::Status Acceptor::Persist(AcceptorState next) {
  auto status = store_.Save(instance_, next);
  if (status.HasError()) {
    LOG_WARN("#{} failed to persist state, stop answering", instance_);
    failed_ = true;
    return status;
  }
  state_ = std::move(next);
  return wheels::make_result::Ok();
}

bool Acceptor::PromisedAtLeast(const ProposalId& id) const {
  return state_.promised.has_value() && id <= *state_.promised;
}

Message Acceptor::Reject(const ProposalId& id, NackReason reason) const {
  return proto::Nack{id, state_.promised.value_or(ProposalId::Zero()),
                     reason};
}

Message Acceptor::Promise() const {
  return proto::Promise{*state_.promised, state_.accepted};
}

Message Acceptor::Vote() const {
  return proto::Accepted{*state_.accepted};
}

}  // namespace synod

#include <synod/actors/acceptor_actor.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

namespace synod {

using namespace proto;

AcceptorActor::AcceptorActor(Context context, IAcceptorStore& store,
                             std::vector<NodeId> learners)
    : logger_("Synod.AcceptorActor", context.runtime->LoggerBackend()),
      context_(std::move(context)),
      store_(store),
      learners_(std::move(learners)) {
}

void AcceptorActor::Handle(const Envelope& envelope) {
  if (crashed_) {
    return;
  }

  last_instance_ = envelope.instance;
  last_message_type_ = KindName(envelope.message);

  if (Failed(envelope.instance)) {
    LOG_DEBUG("#{} ignore {} from {}: instance failed", envelope.instance,
              last_message_type_, envelope.from);
    return;
  }

  std::visit(Overloaded{
                 [&](const proto::Prepare& prepare) {
                   OnPrepare(envelope, prepare);
                 },
                 [&](const proto::Accept& accept) {
                   OnAccept(envelope, accept);
                 },
                 [](const proto::Promise&) {},
                 [](const proto::Nack&) {},
                 [](const proto::Accepted&) {},
                 [](const proto::Decided&) {},
             },
             envelope.message);
}

void AcceptorActor::OnPrepare(const Envelope& request,
                              const proto::Prepare& prepare) {
  auto reply = GetOrCreate(request.instance).Prepare(prepare);
  if (reply.HasError()) {
    OnPersistFailure(request.instance);
    return;
  }

  auto event = std::holds_alternative<proto::Promise>(*reply)
                   ? EventType::PromiseSent
                   : EventType::NackSent;
  Send(request.from, request.instance, std::move(*reply), event);
}

void AcceptorActor::OnAccept(const Envelope& request,
                             const proto::Accept& accept) {
  auto reply = GetOrCreate(request.instance).Accept(accept);
  if (reply.HasError()) {
    OnPersistFailure(request.instance);
    return;
  }

  if (std::holds_alternative<proto::Nack>(*reply)) {
    Send(request.from, request.instance, std::move(*reply),
         EventType::NackSent);
    return;
  }

  if (vote_observer_) {
    vote_observer_(request.instance, context_.self, accept.proposal);
  }

  // Vote goes to the proposer and to every learner
  Send(request.from, request.instance, *reply, EventType::AcceptedSent);
  for (const auto& learner : learners_) {
    if (learner != request.from) {
      Send(learner, request.instance, *reply, EventType::AcceptedSent);
    }
  }
}

void AcceptorActor::OnPersistFailure(InstanceId instance) {
  LOG_ERROR("#{} storage failure, acceptor {} leaves the instance", instance,
            context_.self);
  failed_.insert(instance);
  Emit(instance, EventType::PersistFailed, {});
}

void AcceptorActor::Crash() {
  LOG_INFO("Acceptor {} crashed", context_.self);
  crashed_ = true;
  acceptors_.clear();
}

void AcceptorActor::Recover() {
  LOG_INFO("Acceptor {} recovered", context_.self);
  crashed_ = false;
}

const Acceptor* AcceptorActor::Find(InstanceId instance) const {
  auto it = acceptors_.find(instance);
  return it != acceptors_.end() ? it->second.get() : nullptr;
}

Acceptor& AcceptorActor::GetOrCreate(InstanceId instance) {
  auto& acceptor = acceptors_[instance];
  if (!acceptor) {
    acceptor = std::make_unique<Acceptor>(instance, store_,
                                          context_.runtime->LoggerBackend());
  }
  return *acceptor;
}

NodeSnapshot AcceptorActor::Snapshot() const {
  NodeSnapshot snapshot;
  snapshot.node_id = context_.self;
  snapshot.role = Role::Acceptor;
  snapshot.last_message_type = last_message_type_;

  if (crashed_) {
    snapshot.state = "crashed";
    return snapshot;
  }
  if (Failed(last_instance_)) {
    snapshot.state = "failed";
    return snapshot;
  }

  const Acceptor* acceptor = Find(last_instance_);
  if (acceptor == nullptr) {
    snapshot.state = "idle";
    return snapshot;
  }

  const auto& state = acceptor->State();
  if (state.promised) {
    snapshot.current_round = state.promised->round;
  }
  if (state.accepted) {
    snapshot.state = fmt::format("accepted '{}'", state.accepted->value);
  } else if (state.promised) {
    snapshot.state = "promised";
  } else {
    snapshot.state = "idle";
  }
  return snapshot;
}

void AcceptorActor::Send(const NodeId& to, InstanceId instance,
                         Message message, EventType event) {
  Emit(instance, event, to);
  context_.messenger->Send(
      Envelope{context_.self, to, instance, std::move(message)});
}

void AcceptorActor::Emit(InstanceId instance, EventType type,
                         const NodeId& peer, std::string detail) {
  if (context_.events == nullptr) {
    return;
  }
  context_.events->Record(Event{instance, Role::Acceptor, context_.self, peer,
                                type, context_.runtime->Now(),
                                std::move(detail)});
}

}  // namespace synod

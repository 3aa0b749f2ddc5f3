#include <synod/actors/learner_actor.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

namespace synod {

using namespace proto;

LearnerActor::LearnerActor(Context context, size_t quorum)
    : logger_("Synod.LearnerActor", context.runtime->LoggerBackend()),
      context_(std::move(context)),
      quorum_(quorum) {
}

void LearnerActor::Handle(const Envelope& envelope) {
  last_instance_ = envelope.instance;
  last_message_type_ = KindName(envelope.message);

  std::optional<proto::Decided> decided;

  std::visit(Overloaded{
                 [&](const proto::Accepted& vote) {
                   decided = GetOrCreate(envelope.instance)
                                 .Observe(envelope.from, vote);
                 },
                 [&](const proto::Decided& announcement) {
                   decided = GetOrCreate(envelope.instance)
                                 .Observe(announcement);
                 },
                 [](const proto::Prepare&) {},
                 [](const proto::Promise&) {},
                 [](const proto::Nack&) {},
                 [](const proto::Accept&) {},
             },
             envelope.message);

  if (decided) {
    Report(*decided, envelope.from);
  }
}

void LearnerActor::Report(const proto::Decided& decided, const NodeId& from) {
  if (context_.events != nullptr) {
    context_.events->Record(Event{decided.instance, Role::Learner,
                                  context_.self, from, EventType::Learned,
                                  context_.runtime->Now(), decided.value});
  }
  if (callback_) {
    callback_(decided.instance, decided.value);
  }
}

std::optional<Value> LearnerActor::Decision(InstanceId instance) const {
  auto it = learners_.find(instance);
  if (it == learners_.end()) {
    return std::nullopt;
  }
  return it->second->Decision();
}

size_t LearnerActor::Conflicts() const {
  size_t conflicts = 0;
  for (const auto& [instance, learner] : learners_) {
    conflicts += learner->Conflicts();
  }
  return conflicts;
}

Learner& LearnerActor::GetOrCreate(InstanceId instance) {
  auto& learner = learners_[instance];
  if (!learner) {
    learner = std::make_unique<Learner>(instance, quorum_,
                                        context_.runtime->LoggerBackend());
  }
  return *learner;
}

NodeSnapshot LearnerActor::Snapshot() const {
  NodeSnapshot snapshot;
  snapshot.node_id = context_.self;
  snapshot.role = Role::Learner;
  snapshot.last_message_type = last_message_type_;

  auto decision = Decision(last_instance_);
  snapshot.state =
      decision ? fmt::format("decided '{}'", *decision) : "undecided";
  return snapshot;
}

}  // namespace synod

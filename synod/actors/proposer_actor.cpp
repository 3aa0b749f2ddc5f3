#include <synod/actors/proposer_actor.hpp>

#include <synod/core/errors.hpp>

#include <timber/log.hpp>

#include <fmt/format.h>

namespace synod {

ProposerActor::ProposerActor(Context context, Membership membership,
                             ProposerConfig config)
    : logger_("Synod.ProposerActor", context.runtime->LoggerBackend()),
      context_(std::move(context)),
      membership_(std::move(membership)),
      config_(config) {
  config_.Validate();
}

ProposerActor::~ProposerActor() {
  if (disposal_) {
    context_.runtime->Timers()->Cancel(*disposal_);
  }
}

wheels::Status ProposerActor::Propose(InstanceId instance, Value value,
                                      OutcomeCallback callback) {
  if (active_.contains(instance)) {
    LOG_WARN("#{} already has an active proposer", instance);
    return wheels::make_result::Fail(make_error_code(Errc::Busy));
  }

  LOG_INFO("#{} propose '{}'", instance, value);

  uint64_t min_round = 0;
  if (auto it = records_.find(instance); it != records_.end()) {
    min_round = it->second.highest_round;
  }

  auto on_outcome = [this, instance,
                     callback = std::move(callback)](const Outcome& outcome) {
    Retire(instance, outcome);
    if (callback) {
      callback(outcome);
    }
  };

  auto& proposer = active_[instance];
  proposer = std::make_unique<Proposer>(context_, instance, membership_,
                                        config_, std::move(value),
                                        std::move(on_outcome), min_round);
  last_instance_ = instance;
  proposer->Start();

  return wheels::make_result::Ok();
}

void ProposerActor::Handle(const proto::Envelope& envelope) {
  last_instance_ = envelope.instance;
  last_message_type_ = proto::KindName(envelope.message);

  auto it = active_.find(envelope.instance);
  if (it == active_.end()) {
    LOG_DEBUG("#{} no active proposer for {} from {}", envelope.instance,
              last_message_type_, envelope.from);
    return;
  }
  it->second->Handle(envelope.from, envelope.message);
}

// Called from inside the terminal proposer, it must stay alive
void ProposerActor::Retire(InstanceId instance, const Outcome& outcome) {
  auto it = active_.find(instance);
  if (it == active_.end()) {
    return;
  }
  const auto& proposer = *it->second;
  records_.insert_or_assign(
      instance,
      Record{outcome, proposer.CurrentId(), proposer.HighestRound()});
  finished_.push_back(std::move(it->second));
  active_.erase(it);

  if (!disposal_) {
    disposal_ = context_.runtime->Timers()->After(0, [this]() {
      DisposeFinished();
    });
  }
}

void ProposerActor::DisposeFinished() {
  disposal_.reset();
  LOG_DEBUG("dispose {} terminal proposers", finished_.size());
  finished_.clear();
}

const Proposer* ProposerActor::Find(InstanceId instance) const {
  if (auto it = active_.find(instance); it != active_.end()) {
    return it->second.get();
  }
  return nullptr;
}

const ProposerActor::Record* ProposerActor::Last(InstanceId instance) const {
  if (auto it = records_.find(instance); it != records_.end()) {
    return &it->second;
  }
  return nullptr;
}

NodeSnapshot ProposerActor::Snapshot() const {
  NodeSnapshot snapshot;
  snapshot.node_id = context_.self;
  snapshot.role = Role::Proposer;
  snapshot.last_message_type = last_message_type_;

  if (const Proposer* proposer = Find(last_instance_)) {
    snapshot.current_round = proposer->CurrentId().round;
    snapshot.state = PhaseName(proposer->Phase());
  } else if (const Record* record = Last(last_instance_)) {
    snapshot.current_round = record->last_id.round;
    snapshot.state = PhaseName(record->outcome.Decided()
                                   ? ProposerPhase::Decided
                                   : ProposerPhase::Failed);
  } else {
    snapshot.state = "idle";
  }
  return snapshot;
}

}  // namespace synod
